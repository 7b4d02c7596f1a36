#pragma once

// ============================================================
// sender_app.hpp -- peercp sender: offer one file to a receiver
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/errors.hpp"
#include "../common/session.hpp"
#include "../common/transfer_io.hpp"
#include <string>

struct SenderConfig {
    std::string   host;
    u16           port{PEERCP_DEFAULT_PORT};
    int           connect_timeout_ms{10000};
    SessionConfig session;
};

// Process exit status of the command-line front end
enum ExitCode : int {
    EXIT_CODE_OK       = 0,
    EXIT_CODE_USAGE    = 1,
    EXIT_CODE_FATAL    = 2,  // bind failure, unreadable input file
    EXIT_CODE_REJECTED = 3,
    EXIT_CODE_FAILED   = 4,
};

int exit_code_for(const Outcome& outcome);

class SenderApp {
public:
    explicit SenderApp(SenderConfig config);

    // Connect, offer source under file_name and stream it if accepted.
    // Never throws; a connect failure is FAILED{CONNECTION}.
    Outcome send(FileSource& source, const std::string& file_name);

    const SenderConfig& config() const { return config_; }

private:
    SenderConfig config_;
};
