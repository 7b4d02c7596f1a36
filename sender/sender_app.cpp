// ============================================================
// sender_app.cpp
// ============================================================

#include "sender_app.hpp"
#include "../common/socket.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/hash.hpp"

int exit_code_for(const Outcome& outcome) {
    switch (outcome.kind) {
        case OutcomeKind::COMPLETED: return EXIT_CODE_OK;
        case OutcomeKind::REJECTED:  return EXIT_CODE_REJECTED;
        case OutcomeKind::FAILED:    return EXIT_CODE_FAILED;
    }
    return EXIT_CODE_FAILED;
}

SenderApp::SenderApp(SenderConfig config)
    : config_(std::move(config))
{}

Outcome SenderApp::send(FileSource& source, const std::string& file_name) {
    std::string target = config_.host + ":" + std::to_string(config_.port);
    LOG_INFO("Offering " + file_name + " (" + utils::format_bytes(source.size()) +
             ") to " + target);

    TcpSocket sock(INVALID_SOCKET_VAL);
    try {
        TcpSocket s;
        s.connect(config_.host, config_.port, config_.connect_timeout_ms);
        s.tune();
        sock = std::move(s);
    } catch (const std::exception& e) {
        Outcome outcome = Outcome::failed(ErrorKind::CONNECTION, e.what());
        outcome.file_name = file_name;
        Logger::get().transfer_error(file_name + " -> " + target + ": " + outcome.describe());
        return outcome;
    }

    u64 t0 = utils::steady_ms();
    Outcome outcome;
    try {
        TransferSession session(sock, source, file_name, config_.session);
        outcome = session.run();
    } catch (const std::exception& e) {
        outcome = Outcome::failed(ErrorKind::IO, e.what());
        outcome.file_name = file_name;
    }
    sock.close();
    u64 elapsed = utils::steady_ms() - t0;

    switch (outcome.kind) {
        case OutcomeKind::COMPLETED:
            LOG_INFO("Sent " + file_name + " to " + target + ": " +
                     utils::format_bytes(outcome.bytes) + " in " + std::to_string(elapsed) +
                     " ms (" + utils::format_speed(outcome.bytes, elapsed) +
                     ") xxh3=" + hash::to_hex(outcome.digest));
            break;
        case OutcomeKind::REJECTED:
            LOG_WARN("Receiver " + target + " rejected " + file_name + ": " + outcome.reason);
            break;
        case OutcomeKind::FAILED:
            Logger::get().transfer_error(file_name + " -> " + target + ": " + outcome.describe());
            break;
    }
    return outcome;
}
