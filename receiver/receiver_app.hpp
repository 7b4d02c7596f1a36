#pragma once

// ============================================================
// receiver_app.hpp -- peercp receiver: listening daemon
//   Accepts connections until stop() and runs one receiver
//   TransferSession per connection, each on its own thread.
//
// Concurrency model:
//   accept_loop()  -> poll()s the listening socket so stop() is
//                     noticed within accept_poll_ms, accepts, and
//                     spawns a session thread per socket.
//   session threads -> share nothing but the OutputDirectory's
//                      NameRegistry. Finished ones are joined by
//                      the accept loop; the rest when run() returns.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "../common/session.hpp"
#include "output_dir.hpp"
#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

struct ReceiverConfig {
    std::string   output_dir;
    std::string   listen_ip{"0.0.0.0"};
    u16           listen_port{PEERCP_DEFAULT_PORT};  // 0 = ephemeral
    u64           max_file_size{0};                  // 0 = unlimited
    bool          allow_overwrite{false};
    int           accept_poll_ms{200};
    SessionConfig session;
};

// Called on the session's thread once it has finished
using OutcomeHandler = std::function<void(const Outcome&)>;

class ReceiverApp {
public:
    // policy overrides the one derived from config.max_file_size
    explicit ReceiverApp(ReceiverConfig config, AdmissionPolicy policy = nullptr);
    ~ReceiverApp();

    ReceiverApp(const ReceiverApp&) = delete;
    ReceiverApp& operator=(const ReceiverApp&) = delete;

    // Create the output directory, bind and listen. Throws on failure.
    // run() calls it if it has not been called yet.
    void bind();

    // Port actually bound (useful with listen_port = 0)
    u16 port() const { return bound_port_; }

    // Blocks until stop() is called, then waits for in-flight
    // sessions. Returns 0. Throws if binding fails.
    int run();

    // Stop accepting; async-signal-safe
    void stop();

    // Set before run()
    void set_outcome_handler(OutcomeHandler handler) { handler_ = std::move(handler); }

    bool   accepting() const { return accepting_.load(); }
    size_t active_sessions();
    u64    sessions_started() const { return sessions_started_.load(); }

private:
    struct SessionThread {
        std::thread                        thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    ReceiverConfig    config_;
    OutputDirectory   output_;
    OutcomeHandler    handler_;

    TcpSocket         listen_sock_;
    bool              bound_{false};
    u16               bound_port_{0};
    std::atomic<bool> stop_{false};
    std::atomic<bool> accepting_{false};
    std::atomic<u64>  sessions_started_{0};

    std::list<SessionThread> sessions_;
    std::mutex               sessions_mutex_;

    void accept_loop();
    void launch_session(TcpSocket sock);
    void handle_connection(TcpSocket sock, u64 session_no);

    // Join finished session threads (all of them if wait_all)
    void reap_sessions(bool wait_all);
};
