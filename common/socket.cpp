// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "protocol_io.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <sys/time.h>

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw TransferError(ErrorKind::CONNECTION,
                            "socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != INVALID_SOCKET_VAL) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    int on = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

void TcpSocket::connect(const std::string& host, u16 port, int timeout_ms) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        addrinfo hints{};
        hints.ai_family   = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* res = nullptr;
        int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
        if (rc != 0 || !res) {
            throw TransferError(ErrorKind::CONNECTION,
                                "Cannot resolve " + host + ": " + gai_strerror(rc));
        }
        addr.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
        freeaddrinfo(res);
    }

    std::string target = host + ":" + std::to_string(port);

    if (timeout_ms <= 0) {
        if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
            throw TransferError(ErrorKind::CONNECTION,
                                "connect(" + target + ") failed: " +
                                socket_error_str(last_socket_error()));
        }
        tune();
        return;
    }

    // Bounded connect: non-blocking connect + poll, then back to blocking
    int flags = fcntl(fd_, F_GETFL, 0);
    fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
    int rc = ::connect(fd_, (sockaddr*)&addr, sizeof(addr));
    if (rc == SOCKET_ERROR_VAL && errno != EINPROGRESS) {
        int err = last_socket_error();
        fcntl(fd_, F_SETFL, flags);
        throw TransferError(ErrorKind::CONNECTION,
                            "connect(" + target + ") failed: " + socket_error_str(err));
    }
    if (rc != 0) {
        pollfd pfd{};
        pfd.fd     = fd_;
        pfd.events = POLLOUT;
        int n;
        do {
            n = ::poll(&pfd, 1, timeout_ms);
        } while (n < 0 && errno == EINTR);
        if (n == 0) {
            fcntl(fd_, F_SETFL, flags);
            throw TransferError(ErrorKind::CONNECTION,
                                "connect(" + target + ") timed out after " +
                                std::to_string(timeout_ms) + " ms");
        }
        int soerr = 0;
        socklen_t len = sizeof(soerr);
        if (n < 0 || getsockopt(fd_, SOL_SOCKET, SO_ERROR, &soerr, &len) < 0 || soerr != 0) {
            int err = soerr != 0 ? soerr : last_socket_error();
            fcntl(fd_, F_SETFL, flags);
            throw TransferError(ErrorKind::CONNECTION,
                                "connect(" + target + ") failed: " + socket_error_str(err));
        }
    }
    fcntl(fd_, F_SETFL, flags);
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw TransferError(ErrorKind::CONNECTION, "Invalid bind address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw TransferError(ErrorKind::CONNECTION,
                            "bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw TransferError(ErrorKind::CONNECTION,
                            "listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    if (client == INVALID_SOCKET_VAL) {
        throw TransferError(ErrorKind::CONNECTION,
                            "accept() failed: " + socket_error_str(last_socket_error()));
    }
    return TcpSocket(client);
}

bool TcpSocket::wait_readable(int timeout_ms) {
    pollfd pfd{};
    pfd.fd     = fd_;
    pfd.events = POLLIN;
    int n = ::poll(&pfd, 1, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) return false;
        throw TransferError(ErrorKind::CONNECTION,
                            "poll() failed: " + socket_error_str(last_socket_error()));
    }
    return n > 0;
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent == 0) {
                throw TransferError(ErrorKind::CONNECTION, "Connection closed during send");
            }
            int err = last_socket_error();
            if (err == EINTR) continue;
            if (would_block(err)) {
                throw TransferError(ErrorKind::TIMEOUT, "send() timed out");
            }
            throw TransferError(ErrorKind::CONNECTION, "send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

bool TcpSocket::recv_all(void* buf, size_t len) {
    char* p = static_cast<char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        size_t received = recv_some(p, remaining);
        if (received == 0) return false; // clean close
        p += received;
        remaining -= received;
    }
    return true;
}

size_t TcpSocket::recv_some(void* buf, size_t len) {
    for (;;) {
        ssize_t received = ::recv(fd_, buf, len, 0);
        if (received >= 0) return static_cast<size_t>(received);
        int err = last_socket_error();
        if (err == EINTR) continue;
        if (would_block(err)) {
            throw TransferError(ErrorKind::TIMEOUT, "recv() timed out");
        }
        throw TransferError(ErrorKind::CONNECTION, "recv() failed: " + socket_error_str(err));
    }
}

void TcpSocket::write_message(const Message& msg) {
    std::vector<u8> buf = proto::encode(msg);
    send_all(buf.data(), buf.size());
}

Message TcpSocket::read_message() {
    return proto::read_message(*this);
}

namespace {

// recv_all source bounded by one deadline for all the bytes it reads
class DeadlineReader {
public:
    DeadlineReader(TcpSocket& sock, int timeout_ms)
        : sock_(sock), timeout_ms_(timeout_ms)
        , deadline_(utils::steady_ms() + (u64)timeout_ms) {}

    bool recv_all(void* buf, size_t len) {
        char* p = static_cast<char*>(buf);
        while (len > 0) {
            u64 now = utils::steady_ms();
            if (now >= deadline_) {
                throw TransferError(ErrorKind::TIMEOUT,
                                    "message not complete within " +
                                    std::to_string(timeout_ms_) + " ms");
            }
            if (!sock_.wait_readable((int)(deadline_ - now))) continue;
            size_t got = sock_.recv_some(p, len);
            if (got == 0) return false;
            p   += got;
            len -= got;
        }
        return true;
    }

private:
    TcpSocket& sock_;
    int        timeout_ms_;
    u64        deadline_;
};

} // namespace

Message TcpSocket::read_message_within(int timeout_ms) {
    if (timeout_ms <= 0) return read_message();
    DeadlineReader reader(*this, timeout_ms);
    return proto::read_message(reader);
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

void TcpSocket::reset() {
    if (fd_ != INVALID_SOCKET_VAL) {
        linger lg{};
        lg.l_onoff  = 1;
        lg.l_linger = 0;
        setsockopt(fd_, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
    }
    close();
}

void TcpSocket::shutdown_write() {
    if (fd_ != INVALID_SOCKET_VAL) {
        ::shutdown(fd_, SHUT_WR);
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0 && peer.sin_family == AF_INET) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) {
        throw TransferError(ErrorKind::CONNECTION,
                            "getsockname() failed: " + socket_error_str(last_socket_error()));
    }
    return ntohs(local.sin_port);
}

void TcpSocket::set_recv_timeout_ms(int ms) {
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

void TcpSocket::set_send_timeout_ms(int ms) {
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}
