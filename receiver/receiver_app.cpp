// ============================================================
// receiver_app.cpp -- peercp receiver daemon implementation
// ============================================================

#include "receiver_app.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <chrono>
#include <vector>

static AdmissionPolicy policy_for(const ReceiverConfig& cfg, AdmissionPolicy policy) {
    if (policy) return policy;
    if (cfg.max_file_size > 0) return reject_larger_than(cfg.max_file_size);
    return accept_all();
}

ReceiverApp::ReceiverApp(ReceiverConfig config, AdmissionPolicy policy)
    : config_(std::move(config))
    , output_(config_.output_dir, config_.allow_overwrite,
              policy_for(config_, std::move(policy)))
{}

ReceiverApp::~ReceiverApp() {
    stop();
    reap_sessions(true);
}

void ReceiverApp::bind() {
    if (bound_) return;
    file_io::ensure_dir(config_.output_dir);
    listen_sock_.bind_and_listen(config_.listen_ip, config_.listen_port);
    bound_port_ = listen_sock_.local_port();
    bound_      = true;
}

int ReceiverApp::run() {
    bind();

    LOG_INFO("peercp receiver listening on " + config_.listen_ip + ":" +
             std::to_string(bound_port_) + ", saving to " + config_.output_dir);

    accepting_.store(true);
    accept_loop();
    accepting_.store(false);

    size_t in_flight = active_sessions();
    if (in_flight > 0) {
        LOG_INFO("Stopped accepting; waiting for " + std::to_string(in_flight) +
                 " session(s) to finish");
    }
    reap_sessions(true);
    listen_sock_.close();
    LOG_INFO("Receiver stopped after " + std::to_string(sessions_started_.load()) +
             " session(s)");
    return 0;
}

void ReceiverApp::stop() {
    stop_.store(true);
}

// ---------------------------------------------------------------
// accept_loop
//   Never blocks on a session: each accepted socket goes to its
//   own thread. Errors on one accept are logged and the loop
//   carries on; only stop() ends it.
// ---------------------------------------------------------------
void ReceiverApp::accept_loop() {
    while (!stop_.load()) {
        try {
            if (!listen_sock_.wait_readable(config_.accept_poll_ms)) {
                reap_sessions(false);
                continue;
            }
            TcpSocket sock = listen_sock_.accept();
            sock.tune();
            launch_session(std::move(sock));
            reap_sessions(false);
        } catch (const std::exception& e) {
            if (stop_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
            // e.g. EMFILE: back off instead of failing in a tight loop
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.accept_poll_ms));
        }
    }
}

void ReceiverApp::launch_session(TcpSocket sock) {
    u64 session_no = sessions_started_.fetch_add(1) + 1;
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard<std::mutex> lk(sessions_mutex_);
    SessionThread st;
    st.done   = done;
    st.thread = std::thread(
        [this, s = std::move(sock), session_no, done]() mutable {
            handle_connection(std::move(s), session_no);
            done->store(true);
        });
    sessions_.push_back(std::move(st));
}

void ReceiverApp::handle_connection(TcpSocket sock, u64 session_no) {
    std::string tag = "[session " + std::to_string(session_no) + " " + sock.peer_addr() + "]";
    LOG_DEBUG(tag + " connected");

    Outcome outcome;
    u64 t0 = utils::steady_ms();
    try {
        TransferSession session(sock, output_, config_.session);
        session.set_log_tag(tag);
        outcome = session.run();
    } catch (const std::exception& e) {
        outcome = Outcome::failed(ErrorKind::IO, e.what());
    }
    // A clean close tells the sender the file is committed; any failure
    // resets the connection so the sender cannot mistake it for success
    if (outcome.is_failed()) {
        sock.reset();
    } else {
        sock.close();
    }
    u64 elapsed = utils::steady_ms() - t0;

    std::string name = outcome.file_name.empty() ? "(no offer)" : outcome.file_name;
    switch (outcome.kind) {
        case OutcomeKind::COMPLETED:
            LOG_INFO(tag + " received " + name + " (" + utils::format_bytes(outcome.bytes) +
                     " in " + std::to_string(elapsed) + " ms, " +
                     utils::format_speed(outcome.bytes, elapsed) +
                     ") xxh3=" + hash::to_hex(outcome.digest));
            break;
        case OutcomeKind::REJECTED:
            LOG_WARN(tag + " rejected " + name + ": " + outcome.reason);
            break;
        case OutcomeKind::FAILED:
            Logger::get().transfer_error(tag + " " + name + ": " + outcome.describe());
            break;
    }

    if (handler_) {
        try {
            handler_(outcome);
        } catch (const std::exception& e) {
            LOG_ERROR(tag + " outcome handler threw: " + e.what());
        }
    }
}

size_t ReceiverApp::active_sessions() {
    std::lock_guard<std::mutex> lk(sessions_mutex_);
    size_t n = 0;
    for (auto& st : sessions_) {
        if (!st.done->load()) ++n;
    }
    return n;
}

void ReceiverApp::reap_sessions(bool wait_all) {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lk(sessions_mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end(); ) {
            if (wait_all || it->done->load()) {
                finished.push_back(std::move(it->thread));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& t : finished) {
        if (t.joinable()) t.join();
    }
}
