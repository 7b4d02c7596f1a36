#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <stdexcept>
#include <vector>

// Errors surface as TransferError: CONNECTION for refused/reset/closed
// peers, TIMEOUT when SO_RCVTIMEO/SO_SNDTIMEO elapses.
class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: resolve host (name or dotted quad) and connect,
    // giving up after timeout_ms (0 = OS default)
    void connect(const std::string& host, u16 port, int timeout_ms = 0);

    // Server: bind + listen. port 0 picks an ephemeral port (see local_port)
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 128);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Wait up to timeout_ms for the socket to become readable
    // (for a listening socket: a pending connection)
    bool wait_readable(int timeout_ms);

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes; returns false on clean close.
    // Throws TransferError(TIMEOUT) when the receive timeout elapses.
    bool recv_all(void* buf, size_t len);

    // Receive up to 'len' bytes; returns 0 on clean close
    size_t recv_some(void* buf, size_t len);

    // Encode and send one protocol message
    void write_message(const Message& msg);

    // Read one protocol message; throws DecodeFailure / TransferError
    Message read_message();

    // Same, but the whole message must arrive within timeout_ms
    // (0 = no limit); throws TransferError(TIMEOUT) otherwise
    Message read_message_within(int timeout_ms);

    // Apply TCP tuning (nodelay, keepalive)
    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    void close();

    // Abortive close: the peer sees a reset instead of a clean EOF
    void reset();

    // Half-close: no more writes, peer sees EOF
    void shutdown_write();

    // Get peer address as string
    std::string peer_addr() const;

    // Port this socket is bound to
    u16 local_port() const;

    // Set receive/send timeouts in milliseconds (0 = infinite)
    void set_recv_timeout_ms(int ms);
    void set_send_timeout_ms(int ms);

private:
    socket_t fd_{INVALID_SOCKET_VAL};

    void apply_socket_opts();
};
