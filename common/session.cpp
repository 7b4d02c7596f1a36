// ============================================================
// session.cpp -- Handshake state machine and data phase
// ============================================================

#include "session.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <algorithm>
#include <string>
#include <utility>
#include <variant>

const char* role_name(Role r) {
    switch (r) {
        case Role::SENDER:   return "sender";
        case Role::RECEIVER: return "receiver";
    }
    return "?";
}

const char* state_name(SessionState s) {
    switch (s) {
        case SessionState::START:          return "START";
        case SessionState::AWAITING_OFFER: return "AWAITING_OFFER";
        case SessionState::OFFER_SENT:     return "OFFER_SENT";
        case SessionState::ACCEPTED:       return "ACCEPTED";
        case SessionState::TRANSFERRING:   return "TRANSFERRING";
        case SessionState::DONE:           return "DONE";
        case SessionState::ABORTED:        return "ABORTED";
    }
    return "?";
}

TransferSession::TransferSession(TcpSocket& sock, FileSource& source,
                                 std::string file_name, const SessionConfig& cfg)
    : sock_(sock)
    , tag_("[" + sock.peer_addr() + "]")
    , role_(Role::SENDER)
    , cfg_(cfg)
    , source_(&source)
    , file_name_(std::move(file_name))
    , file_size_(source.size())
{}

TransferSession::TransferSession(TcpSocket& sock, ReceiveTarget& target,
                                 const SessionConfig& cfg)
    : sock_(sock)
    , tag_("[" + sock.peer_addr() + "]")
    , role_(Role::RECEIVER)
    , cfg_(cfg)
    , target_(&target)
{}

Outcome TransferSession::run() {
    buf_.resize(std::max<size_t>(cfg_.buffer_size, 4096));

    try {
        while (!finished()) {
            if (role_ == Role::SENDER) {
                step_sender();
            } else {
                step_receiver();
            }
        }
    } catch (const TransferError& e) {
        abort(e.kind(), e.what());
    } catch (const DecodeFailure& e) {
        // A stream that ends mid-message is a peer that went away
        abort(e.error() == DecodeError::TRUNCATED ? ErrorKind::CONNECTION
                                                  : ErrorKind::DECODE,
              e.what());
    } catch (const std::exception& e) {
        abort(ErrorKind::IO, e.what());
    }

    outcome_.file_name = file_name_;
    return outcome_;
}

// ---------------------------------------------------------------
// Sender role
// ---------------------------------------------------------------

void TransferSession::step_sender() {
    switch (state_) {
        case SessionState::START: {
            std::string problem = file_io::file_name_problem(file_name_);
            if (problem.empty() && file_name_.size() > MAX_STRING_LEN) {
                problem = "file name longer than " + std::to_string(MAX_STRING_LEN) + " bytes";
            }
            if (!problem.empty()) {
                abort(ErrorKind::PATH_SECURITY, problem);
                return;
            }
            sock_.set_send_timeout_ms(cfg_.io_timeout_ms);
            sock_.write_message(Hello{file_name_, file_size_});
            LOG_DEBUG(tag_ + " HELLO sent: " + file_name_ + " (" +
                      std::to_string(file_size_) + " bytes)");
            state_ = SessionState::OFFER_SENT;
            return;
        }
        case SessionState::OFFER_SENT:
            on_offer_response(await_message());
            return;
        case SessionState::TRANSFERRING:
            stream_out();
            return;
        default:
            abort(ErrorKind::PROTOCOL_VIOLATION,
                  std::string("sender has no transition from ") + state_name(state_));
            return;
    }
}

void TransferSession::on_offer_response(const Message& msg) {
    if (const Nack* nack = std::get_if<Nack>(&msg)) {
        LOG_DEBUG(tag_ + " NACK received: " + nack->reason);
        finish(Outcome::rejected(nack->reason));
        return;
    }
    if (!std::holds_alternative<Ack>(msg)) unexpected(msg);

    // Re-state the size: the receiver checks it against HELLO
    sock_.write_message(Send{file_size_});
    state_ = SessionState::TRANSFERRING;
}

void TransferSession::stream_out() {
    sock_.set_send_timeout_ms(cfg_.io_timeout_ms);

    while (bytes_done_ < file_size_) {
        size_t want = (size_t)std::min<u64>(buf_.size(), file_size_ - bytes_done_);
        size_t got  = source_->read(buf_.data(), want);
        if (got == 0) {
            abort(ErrorKind::IO, "source ended after " + std::to_string(bytes_done_) +
                                 " of " + std::to_string(file_size_) + " bytes");
            return;
        }
        got = std::min(got, want);
        sock_.send_all(buf_.data(), got);
        hasher_.update(buf_.data(), got);
        bytes_done_ += got;
    }

    // Half-close, then wait for the receiver to close its side. It only
    // does so once every byte has been read and the file committed.
    sock_.shutdown_write();
    sock_.set_recv_timeout_ms(cfg_.io_timeout_ms);
    u8 extra;
    if (sock_.recv_some(&extra, 1) != 0) {
        abort(ErrorKind::PROTOCOL_VIOLATION, "receiver sent data after SEND");
        return;
    }
    finish(Outcome::completed(bytes_done_, hasher_.digest()));
}

// ---------------------------------------------------------------
// Receiver role
// ---------------------------------------------------------------

void TransferSession::step_receiver() {
    switch (state_) {
        case SessionState::START:
            state_ = SessionState::AWAITING_OFFER;
            return;
        case SessionState::AWAITING_OFFER:
            on_offer(await_message());
            return;
        case SessionState::ACCEPTED:
            on_send(await_message());
            return;
        case SessionState::TRANSFERRING:
            stream_in();
            return;
        default:
            abort(ErrorKind::PROTOCOL_VIOLATION,
                  std::string("receiver has no transition from ") + state_name(state_));
            return;
    }
}

void TransferSession::on_offer(const Message& msg) {
    const Hello* hello = std::get_if<Hello>(&msg);
    if (!hello) unexpected(msg);

    file_name_ = hello->file_name;
    file_size_ = hello->file_size;
    LOG_INFO(tag_ + " offer: " + file_name_ + " (" +
             std::to_string(file_size_) + " bytes)");

    sock_.set_send_timeout_ms(cfg_.io_timeout_ms);

    Admission adm = target_->admit(file_name_, file_size_);
    if (!adm.accepted) {
        try {
            sock_.write_message(Nack{adm.reason});
        } catch (const TransferError& e) {
            // The offer is refused either way
            LOG_DEBUG(tag_ + " NACK not delivered: " + e.what());
        }
        finish(Outcome::rejected(adm.reason, adm.error));
        return;
    }

    sink_ = std::move(adm.sink);
    sock_.write_message(Ack{});
    LOG_DEBUG(tag_ + " accepted " + file_name_);
    state_ = SessionState::ACCEPTED;
}

void TransferSession::on_send(const Message& msg) {
    const Send* send = std::get_if<Send>(&msg);
    if (!send) unexpected(msg);

    if (send->file_size != file_size_) {
        abort(ErrorKind::PROTOCOL_VIOLATION,
              "SEND size " + std::to_string(send->file_size) +
              " does not match HELLO size " + std::to_string(file_size_));
        return;
    }

    sink_->open(file_size_);
    state_ = SessionState::TRANSFERRING;
}

void TransferSession::stream_in() {
    sock_.set_recv_timeout_ms(cfg_.io_timeout_ms);

    while (bytes_done_ < file_size_) {
        size_t want = (size_t)std::min<u64>(buf_.size(), file_size_ - bytes_done_);
        size_t got  = sock_.recv_some(buf_.data(), want);
        if (got == 0) {
            abort(ErrorKind::CONNECTION,
                  "peer closed after " + std::to_string(bytes_done_) +
                  " of " + std::to_string(file_size_) + " bytes");
            return;
        }
        sink_->write(buf_.data(), got);
        hasher_.update(buf_.data(), got);
        bytes_done_ += got;
    }

    sink_->commit();
    sink_.reset();
    finish(Outcome::completed(bytes_done_, hasher_.digest()));
}

// ---------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------

Message TransferSession::await_message() {
    sock_.set_recv_timeout_ms(cfg_.handshake_timeout_ms);
    try {
        // One deadline for the whole message, not per recv()
        Message msg = sock_.read_message_within(cfg_.handshake_timeout_ms);
        LOG_DEBUG(tag_ + " " + msg_name(msg) + " in " + state_name(state_));
        return msg;
    } catch (const TransferError& e) {
        if (e.kind() != ErrorKind::TIMEOUT) throw;
        throw TransferError(ErrorKind::TIMEOUT,
                            "no complete message within " + std::to_string(cfg_.handshake_timeout_ms) +
                            " ms in " + state_name(state_));
    }
}

void TransferSession::unexpected(const Message& msg) {
    throw TransferError(ErrorKind::PROTOCOL_VIOLATION,
                        std::string("unexpected ") + msg_name(msg) + " in " +
                        state_name(state_));
}

void TransferSession::finish(Outcome outcome) {
    state_   = SessionState::DONE;
    outcome_ = std::move(outcome);
}

void TransferSession::abort(ErrorKind kind, const std::string& detail) {
    LOG_DEBUG(tag_ + " " + role_name(role_) + " aborted in " +
              state_name(state_) + ": " + detail);
    state_   = SessionState::ABORTED;
    outcome_ = Outcome::failed(kind, detail);
    sink_.reset();
}
