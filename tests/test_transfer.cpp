// ============================================================
// test_transfer.cpp -- Sender and receiver engines over loopback
// ============================================================

#include "receiver/receiver_app.hpp"
#include "sender/sender_app.hpp"
#include "sender/file_source.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::string make_content(size_t len, u32 seed) {
    std::string s(len, '\0');
    u32 x = seed * 2654435761u + 1;
    for (size_t i = 0; i < len; ++i) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        s[i] = (char)(x & 0xFF);
    }
    return s;
}

class TransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::get().set_level(LogLevel::OFF);
        base_ = fs::temp_directory_path() /
                ("peercp-e2e-" + std::to_string(utils::generate_id()));
        src_ = base_ / "src";
        out_ = base_ / "out" / "inbox";  // created by the receiver
        fs::create_directories(src_);
    }

    void TearDown() override {
        stop_receiver();
        std::error_code ec;
        fs::remove_all(base_, ec);
    }

    void start_receiver(bool allow_overwrite = false, u64 max_size = 0) {
        ReceiverConfig cfg;
        cfg.output_dir      = out_.string();
        cfg.listen_ip       = "127.0.0.1";
        cfg.listen_port     = 0;
        cfg.allow_overwrite = allow_overwrite;
        cfg.max_file_size   = max_size;
        cfg.accept_poll_ms  = 50;
        cfg.session.handshake_timeout_ms = 5000;
        cfg.session.io_timeout_ms        = 5000;

        app_ = std::make_unique<ReceiverApp>(cfg);
        app_->set_outcome_handler([this](const Outcome& o) {
            std::lock_guard<std::mutex> lk(mutex_);
            outcomes_.push_back(o);
        });
        app_->bind();
        port_ = app_->port();
        runner_ = std::thread([this] { app_->run(); });
    }

    void stop_receiver() {
        if (!app_) return;
        app_->stop();
        if (runner_.joinable()) runner_.join();
        app_.reset();
    }

    fs::path write_source(const std::string& name, const std::string& content) {
        fs::path p = src_ / name;
        std::ofstream f(p, std::ios::binary);
        f.write(content.data(), (std::streamsize)content.size());
        return p;
    }

    SenderConfig sender_config() {
        SenderConfig cfg;
        cfg.host = "127.0.0.1";
        cfg.port = port_;
        cfg.connect_timeout_ms = 2000;
        cfg.session.handshake_timeout_ms = 5000;
        cfg.session.io_timeout_ms        = 5000;
        return cfg;
    }

    Outcome send(const fs::path& path, const std::string& name) {
        MappedFileSource source(path.string());
        SenderApp sender(sender_config());
        return sender.send(source, name);
    }

    // Receiver outcomes are reported just after the sender sees EOF
    std::vector<Outcome> wait_for_outcomes(size_t n) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        for (;;) {
            {
                std::lock_guard<std::mutex> lk(mutex_);
                if (outcomes_.size() >= n || std::chrono::steady_clock::now() > deadline) {
                    return outcomes_;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    fs::path base_, src_, out_;
    u16      port_{0};
    std::unique_ptr<ReceiverApp> app_;
    std::thread                  runner_;
    std::mutex                   mutex_;
    std::vector<Outcome>         outcomes_;
};

} // namespace

TEST_F(TransferTest, FileArrivesByteForByte) {
    start_receiver();
    std::string content = make_content(3 * 1024 * 1024 + 17, 1);
    fs::path src = write_source("photo.raw", content);

    Outcome sent = send(src, "photo.raw");
    ASSERT_TRUE(sent.is_completed()) << sent.describe();
    EXPECT_EQ(sent.bytes, content.size());

    // The receiver closes only after committing the file
    EXPECT_TRUE(test_util::read_file(out_ / "photo.raw") == content);

    std::vector<Outcome> got = wait_for_outcomes(1);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_TRUE(got[0].is_completed());
    EXPECT_EQ(got[0].bytes, content.size());
    EXPECT_EQ(got[0].file_name, "photo.raw");
    EXPECT_EQ(got[0].digest, sent.digest);
    EXPECT_EQ(sent.digest, hash::xxh3_128(content.data(), content.size()));
}

TEST_F(TransferTest, EmptyFile) {
    start_receiver();
    fs::path src = write_source("empty.txt", "");
    Outcome sent = send(src, "empty.txt");
    ASSERT_TRUE(sent.is_completed()) << sent.describe();
    EXPECT_TRUE(fs::exists(out_ / "empty.txt"));
    EXPECT_EQ(fs::file_size(out_ / "empty.txt"), 0u);
}

TEST_F(TransferTest, TraversalNameIsRejected) {
    start_receiver();

    TcpSocket sock;
    sock.connect("127.0.0.1", port_, 2000);
    sock.set_recv_timeout_ms(5000);
    sock.write_message(Hello{"../secret", 5});
    Message reply = sock.read_message();
    ASSERT_TRUE(std::holds_alternative<Nack>(reply));
    sock.close();

    std::vector<Outcome> got = wait_for_outcomes(1);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_TRUE(got[0].is_rejected());
    EXPECT_EQ(got[0].error, ErrorKind::PATH_SECURITY);
    EXPECT_FALSE(fs::exists(out_.parent_path() / "secret"));
    EXPECT_FALSE(fs::exists(out_ / "secret"));
}

TEST_F(TransferTest, OverlongNameIsRejectedBeforeAck) {
    start_receiver();

    TcpSocket sock;
    sock.connect("127.0.0.1", port_, 2000);
    sock.set_recv_timeout_ms(5000);
    sock.write_message(Hello{std::string(300, 'n'), 5});
    Message reply = sock.read_message();
    ASSERT_TRUE(std::holds_alternative<Nack>(reply));
    sock.close();

    std::vector<Outcome> got = wait_for_outcomes(1);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_TRUE(got[0].is_rejected());
    EXPECT_EQ(got[0].error, ErrorKind::PATH_SECURITY);
}

TEST_F(TransferTest, CommitFailureIsReportedToSender) {
    start_receiver(true);
    // Renaming a file over a non-empty directory fails
    fs::create_directories(out_ / "blocked.bin" / "inner");
    fs::path src = write_source("blocked.bin", "payload");

    Outcome sent = send(src, "blocked.bin");
    EXPECT_TRUE(sent.is_failed()) << sent.describe();
    EXPECT_EQ(sent.error, ErrorKind::CONNECTION);
    EXPECT_EQ(exit_code_for(sent), EXIT_CODE_FAILED);

    std::vector<Outcome> got = wait_for_outcomes(1);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_TRUE(got[0].is_failed());
    EXPECT_EQ(got[0].error, ErrorKind::IO);

    EXPECT_TRUE(fs::is_directory(out_ / "blocked.bin"));
    size_t files = 0;
    for (auto it = fs::directory_iterator(out_); it != fs::directory_iterator(); ++it) ++files;
    EXPECT_EQ(files, 1u);  // the temp file is gone
}

TEST_F(TransferTest, SameNameTwiceAtOnce) {
    start_receiver();
    fs::path a = write_source("a.bin", make_content(4 * 1024 * 1024, 2));
    fs::path b = write_source("b.bin", make_content(4 * 1024 * 1024, 3));

    Outcome out_a, out_b;
    std::thread ta([&] { out_a = send(a, "dup.bin"); });
    std::thread tb([&] { out_b = send(b, "dup.bin"); });
    ta.join();
    tb.join();

    int completed = (int)out_a.is_completed() + (int)out_b.is_completed();
    int rejected  = (int)out_a.is_rejected() + (int)out_b.is_rejected();
    EXPECT_EQ(completed, 1) << out_a.describe() << " / " << out_b.describe();
    EXPECT_EQ(rejected, 1) << out_a.describe() << " / " << out_b.describe();

    const fs::path& winner = out_a.is_completed() ? a : b;
    EXPECT_TRUE(test_util::read_file(out_ / "dup.bin") == test_util::read_file(winner));
}

TEST_F(TransferTest, ExistingFileIsKeptUnlessOverwriting) {
    fs::create_directories(out_);
    std::ofstream(out_ / "keep.txt") << "original";
    fs::path src = write_source("keep.txt", "replacement");

    start_receiver(false);
    Outcome refused = send(src, "keep.txt");
    EXPECT_TRUE(refused.is_rejected());
    EXPECT_EQ(refused.reason, "file already exists");
    EXPECT_EQ(test_util::read_file(out_ / "keep.txt"), "original");
    stop_receiver();

    start_receiver(true);
    Outcome replaced = send(src, "keep.txt");
    EXPECT_TRUE(replaced.is_completed()) << replaced.describe();
    EXPECT_EQ(test_util::read_file(out_ / "keep.txt"), "replacement");
}

TEST_F(TransferTest, OversizedOfferIsRejected) {
    start_receiver(false, 1000);
    fs::path src = write_source("big.bin", make_content(1001, 4));
    Outcome out = send(src, "big.bin");
    EXPECT_TRUE(out.is_rejected());
    EXPECT_FALSE(fs::exists(out_ / "big.bin"));
    EXPECT_EQ(exit_code_for(out), EXIT_CODE_REJECTED);
}

TEST_F(TransferTest, FiftyConcurrentSenders) {
    start_receiver();
    const int n = 50;
    std::vector<std::string> contents;
    std::vector<fs::path> paths;
    for (int i = 0; i < n; ++i) {
        contents.push_back(make_content(64 * 1024 + (size_t)i * 97, (u32)i + 100));
        paths.push_back(write_source("f" + std::to_string(i), contents.back()));
    }

    std::vector<Outcome> results((size_t)n);
    std::vector<std::thread> threads;
    for (int i = 0; i < n; ++i) {
        threads.emplace_back([&, i] {
            results[(size_t)i] = send(paths[(size_t)i], "file-" + std::to_string(i) + ".bin");
        });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < n; ++i) {
        ASSERT_TRUE(results[(size_t)i].is_completed()) << i << ": " << results[(size_t)i].describe();
        EXPECT_TRUE(test_util::read_file(out_ / ("file-" + std::to_string(i) + ".bin")) == contents[(size_t)i])
            << "file " << i;
    }
    EXPECT_EQ(wait_for_outcomes((size_t)n).size(), (size_t)n);

    size_t files = 0;
    for (auto it = fs::directory_iterator(out_); it != fs::directory_iterator(); ++it) ++files;
    EXPECT_EQ(files, (size_t)n);  // no temp files left behind
}

TEST_F(TransferTest, StoppedReceiverRefusesConnections) {
    start_receiver();
    u16 port = port_;
    stop_receiver();

    port_ = port;
    fs::path src = write_source("late.txt", "late");
    Outcome out = send(src, "late.txt");
    EXPECT_TRUE(out.is_failed());
    EXPECT_EQ(out.error, ErrorKind::CONNECTION);
    EXPECT_EQ(exit_code_for(out), EXIT_CODE_FAILED);
}

TEST_F(TransferTest, SecondBindOnSamePortFails) {
    start_receiver();
    ReceiverConfig cfg;
    cfg.output_dir  = out_.string();
    cfg.listen_ip   = "127.0.0.1";
    cfg.listen_port = port_;
    ReceiverApp second(cfg);
    EXPECT_THROW(second.bind(), TransferError);
}

TEST(SenderTimeout, SilentListenerTimesOut) {
    Logger::get().set_level(LogLevel::OFF);
    fs::path dir = fs::temp_directory_path() /
                   ("peercp-silent-" + std::to_string(utils::generate_id()));
    fs::create_directories(dir);
    fs::path src = dir / "x.txt";
    std::ofstream(src) << "hello";

    // Connections complete in the backlog but nobody ever answers
    TcpSocket listener;
    listener.bind_and_listen("127.0.0.1", 0);

    SenderConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = listener.local_port();
    cfg.session.handshake_timeout_ms = 300;
    MappedFileSource source(src.string());
    Outcome out = SenderApp(cfg).send(source, "x.txt");

    EXPECT_TRUE(out.is_failed());
    EXPECT_EQ(out.error, ErrorKind::TIMEOUT);
    EXPECT_EQ(exit_code_for(out), EXIT_CODE_FAILED);

    std::error_code ec;
    fs::remove_all(dir, ec);
}
