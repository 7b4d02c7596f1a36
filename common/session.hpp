#pragma once

// ============================================================
// session.hpp -- One transfer over one connection
//
//   sender:   START -> OFFER_SENT -> TRANSFERRING -> DONE
//                          \-> DONE (NACK) / ABORTED
//   receiver: START -> AWAITING_OFFER -> ACCEPTED -> TRANSFERRING -> DONE
//                          \-> DONE (NACK)  \-> ABORTED
//
// run() drives the state machine to a terminal state and converts
// every error into an Outcome; nothing escapes to the caller.
// The socket is borrowed and closed by its owner afterwards.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "socket.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include "transfer_io.hpp"
#include <memory>
#include <string>
#include <vector>

struct SessionConfig {
    int    handshake_timeout_ms{30000};  // whole of each HELLO / ACK|NACK / SEND
    int    io_timeout_ms{30000};         // each read/write during the data phase
    size_t buffer_size{256 * 1024};
};

enum class Role : u8 {
    SENDER   = 0,
    RECEIVER = 1,
};

enum class SessionState : u8 {
    START          = 0,
    AWAITING_OFFER = 1,  // receiver: waiting for HELLO
    OFFER_SENT     = 2,  // sender: waiting for ACK/NACK
    ACCEPTED       = 3,  // receiver: ACK sent, waiting for SEND
    TRANSFERRING   = 4,
    DONE           = 5,
    ABORTED        = 6,
};

const char* role_name(Role r);
const char* state_name(SessionState s);

class TransferSession {
public:
    // Sender role: offer source under file_name
    TransferSession(TcpSocket& sock, FileSource& source,
                    std::string file_name, const SessionConfig& cfg);

    // Receiver role: offers are decided by target
    TransferSession(TcpSocket& sock, ReceiveTarget& target,
                    const SessionConfig& cfg);

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Blocks until DONE or ABORTED
    Outcome run();

    Role         role() const { return role_; }
    SessionState state() const { return state_; }
    bool         finished() const {
        return state_ == SessionState::DONE || state_ == SessionState::ABORTED;
    }
    const std::string& file_name() const { return file_name_; }
    u64 file_size() const { return file_size_; }
    u64 bytes_transferred() const { return bytes_done_; }

    // Prefix for this session's log lines (default "[peer addr]")
    void set_log_tag(const std::string& tag) { tag_ = tag; }

private:
    void step_sender();
    void step_receiver();

    void on_offer_response(const Message& msg);   // sender, OFFER_SENT
    void on_offer(const Message& msg);            // receiver, AWAITING_OFFER
    void on_send(const Message& msg);             // receiver, ACCEPTED

    void stream_out();                            // sender, TRANSFERRING
    void stream_in();                             // receiver, TRANSFERRING

    Message await_message();
    void unexpected(const Message& msg);  // always throws

    void finish(Outcome outcome);
    void abort(ErrorKind kind, const std::string& detail);

    TcpSocket&     sock_;
    std::string    tag_;  // log prefix
    Role           role_;
    SessionConfig  cfg_;
    SessionState   state_{SessionState::START};

    FileSource*    source_{nullptr};
    ReceiveTarget* target_{nullptr};
    std::unique_ptr<FileSink> sink_;

    std::string    file_name_;
    u64            file_size_{0};
    u64            bytes_done_{0};

    hash::StreamHasher128 hasher_;
    std::vector<u8>       buf_;
    Outcome               outcome_;
};
