// ============================================================
// cli/main.cpp -- peercp entry point (listen | send)
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/file_io.hpp"
#include "../receiver/receiver_app.hpp"
#include "../sender/sender_app.hpp"
#include "../sender/file_source.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static ReceiverApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage:\n"
        << "  " << prog << " listen --port <PORT> --output <DIR> [options]\n"
        << "  " << prog << " send --file <PATH> --to <HOST> --port <PORT> [options]\n"
        << "\nlisten options:\n"
        << "  --bind IP        address to listen on (default: 0.0.0.0)\n"
        << "  --max-size N     reject offers larger than N bytes (default: unlimited)\n"
        << "  --overwrite      replace existing files instead of rejecting them\n"
        << "\nsend options:\n"
        << "  --name NAME      name to offer (default: base name of --file)\n"
        << "\ncommon options:\n"
        << "  --timeout SECS   handshake and I/O timeout (default: 30)\n"
        << "  --verbose        enable debug logging\n"
        << "  --log-file PATH  also append log lines to PATH\n"
        << "\nExit codes: 0 ok, 1 usage, 2 fatal, 3 rejected, 4 failed\n"
        << "\nExamples:\n"
        << "  " << prog << " listen --port 40001 --output /srv/incoming\n"
        << "  " << prog << " send --file ./report.pdf --to 192.168.1.7 --port 40001\n";
}

// Options shared by both subcommands; returns false if arg is not one
static bool parse_common(int argc, char* argv[], int& i, SessionConfig& session,
                         std::string& log_file, bool& ok) {
    ok = true;
    if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
        u64 secs = 0;
        if (!utils::parse_u64(argv[++i], secs) || secs < 1 || secs > 86400) {
            std::cerr << "ERROR: --timeout must be 1-86400 seconds\n";
            ok = false;
            return true;
        }
        session.handshake_timeout_ms = (int)(secs * 1000);
        session.io_timeout_ms        = (int)(secs * 1000);
        return true;
    }
    if (std::strcmp(argv[i], "--verbose") == 0) {
        Logger::get().set_level(LogLevel::DEBUG);
        return true;
    }
    if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
        log_file = argv[++i];
        return true;
    }
    return false;
}

static bool parse_port(const char* s, u16& out) {
    u64 v = 0;
    if (!utils::parse_u64(s, v) || !utils::validate_port((long)v)) {
        std::cerr << "ERROR: Invalid port: " << s << "\n";
        return false;
    }
    out = (u16)v;
    return true;
}

static bool open_log_file(const std::string& path) {
    if (path.empty()) return true;
    if (!Logger::get().set_log_file(path)) {
        std::cerr << "ERROR: Cannot open log file: " << path << "\n";
        return false;
    }
    return true;
}

static int run_listen(int argc, char* argv[]) {
    ReceiverConfig cfg;
    std::string log_file;
    bool have_port = false;

    for (int i = 2; i < argc; ++i) {
        bool ok = true;
        if (parse_common(argc, argv, i, cfg.session, log_file, ok)) {
            if (!ok) return EXIT_CODE_USAGE;
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            if (!parse_port(argv[++i], cfg.listen_port)) return EXIT_CODE_USAGE;
            have_port = true;
        } else if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            cfg.output_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--bind") == 0 && i + 1 < argc) {
            cfg.listen_ip = argv[++i];
        } else if (std::strcmp(argv[i], "--max-size") == 0 && i + 1 < argc) {
            if (!utils::parse_u64(argv[++i], cfg.max_file_size) || cfg.max_file_size == 0) {
                std::cerr << "ERROR: --max-size must be a positive byte count\n";
                return EXIT_CODE_USAGE;
            }
        } else if (std::strcmp(argv[i], "--overwrite") == 0) {
            cfg.allow_overwrite = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return EXIT_CODE_USAGE;
        }
    }

    if (!have_port) {
        std::cerr << "ERROR: --port is required\n";
        return EXIT_CODE_USAGE;
    }
    if (!utils::validate_path(cfg.output_dir)) {
        std::cerr << "ERROR: --output is required\n";
        return EXIT_CODE_USAGE;
    }
    if (cfg.listen_ip != "0.0.0.0" && !utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.listen_ip << "\n";
        return EXIT_CODE_USAGE;
    }
    if (!open_log_file(log_file)) return EXIT_CODE_FATAL;

    try {
        ReceiverApp app(std::move(cfg));
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "FATAL: " << e.what() << "\n";
        return EXIT_CODE_FATAL;
    }
}

static int run_send(int argc, char* argv[]) {
    SenderConfig cfg;
    std::string file_path;
    std::string offer_name;
    std::string log_file;
    bool have_port = false;

    for (int i = 2; i < argc; ++i) {
        bool ok = true;
        if (parse_common(argc, argv, i, cfg.session, log_file, ok)) {
            if (!ok) return EXIT_CODE_USAGE;
        } else if (std::strcmp(argv[i], "--file") == 0 && i + 1 < argc) {
            file_path = argv[++i];
        } else if (std::strcmp(argv[i], "--to") == 0 && i + 1 < argc) {
            cfg.host = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            if (!parse_port(argv[++i], cfg.port)) return EXIT_CODE_USAGE;
            have_port = true;
        } else if (std::strcmp(argv[i], "--name") == 0 && i + 1 < argc) {
            offer_name = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return EXIT_CODE_USAGE;
        }
    }

    if (!utils::validate_path(file_path)) {
        std::cerr << "ERROR: --file is required\n";
        return EXIT_CODE_USAGE;
    }
    if (cfg.host.empty()) {
        std::cerr << "ERROR: --to is required\n";
        return EXIT_CODE_USAGE;
    }
    if (!have_port) {
        std::cerr << "ERROR: --port is required\n";
        return EXIT_CODE_USAGE;
    }
    if (offer_name.empty()) offer_name = file_io::base_name(file_path);
    if (!open_log_file(log_file)) return EXIT_CODE_FATAL;

    std::unique_ptr<MappedFileSource> source;
    try {
        source = std::make_unique<MappedFileSource>(file_path);
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return EXIT_CODE_FATAL;
    }

    SenderApp app(std::move(cfg));
    Outcome outcome = app.send(*source, offer_name);
    return exit_code_for(outcome);
}

int main(int argc, char* argv[]) {
    // Writes to a peer that already closed must fail with EPIPE
    platform::ignore_sigpipe();
    Logger::get().set_level(LogLevel::INFO);

    if (argc < 2) {
        print_usage(argv[0]);
        return EXIT_CODE_USAGE;
    }

    if (std::strcmp(argv[1], "listen") == 0) return run_listen(argc, argv);
    if (std::strcmp(argv[1], "send") == 0)   return run_send(argc, argv);

    std::cerr << "Unknown command: " << argv[1] << "\n";
    print_usage(argv[0]);
    return EXIT_CODE_USAGE;
}
