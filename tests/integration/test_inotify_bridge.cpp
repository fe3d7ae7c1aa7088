/**
 * @file test_inotify_bridge.cpp
 * @brief End-to-end tests: real inotify source, full bridge, protocol over a pipe
 *
 * Covers:
 * - Changes in new subdirectories
 * - Renames reported at both ends
 * - Rapid writes collapsing into one entry
 * - A replica whose directory is removed, then recreated and started again
 * - Subscriptions released when the command stream closes
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <future>
#include <set>
#include <thread>
#include <chrono>
#include <unistd.h>

#include "BridgeCore.h"
#include "Constants.h"
#include "FdGuard.h"
#include "InotifyEventSource.h"
#include "LineCapture.h"
#include "ProtocolCodec.h"

using namespace WatchBridge;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class InotifyBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / ("watchbridge_it_" + std::to_string(::getpid()) + "_" +
                                                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(testDir_);
        fs::create_directories(testDir_ / "replica");
        replica_ = fs::canonical(testDir_ / "replica");

        int fds[2];
        ASSERT_EQ(pipe(fds), 0);
        input_.reset(fds[0]);
        host_.reset(fds[1]);
    }

    void TearDown() override {
        host_.reset();
        if (exit_.valid()) {
            exit_.wait();
        }
        bridge_.reset();
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    void launch() {
        auto source = std::make_unique<InotifyEventSource>();
        source_ = source.get();

        BridgeConfig config;
        config.debounce = 50ms;
        config.maxDelay = 500ms;
        bridge_ = std::make_unique<BridgeCore>(config, std::move(source), input_.get(), out_);
        ASSERT_TRUE(bridge_->initialize());

        exit_ = std::async(std::launch::async, [this]() { return bridge_->run(); });
        ASSERT_EQ(out_.next(), std::string("VERSION 1"));

        send("VERSION 1");
        send("START r " + ProtocolCodec::quote(replica_.string()));
        ASSERT_EQ(out_.next(), std::string("OK"));
        send("DONE");
    }

    void send(const std::string& line) {
        std::string data = line + "\n";
        ASSERT_EQ(::write(host_.get(), data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void createFile(const fs::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    /// Wait for the bridge to announce changes, then collect the reported paths
    std::set<std::string> waitForChanges() {
        send("WAIT r");
        auto announced = out_.next(5s);
        EXPECT_EQ(announced, std::string("CHANGES r"));

        // Let trailing events land in the same batch
        std::this_thread::sleep_for(200ms);
        send("CHANGES r");

        std::set<std::string> paths;
        for (;;) {
            auto line = out_.next(5s);
            if (!line || *line == "DONE") {
                break;
            }
            auto command = ProtocolCodec::parse(*line);
            EXPECT_TRUE(command);
            if (command && command.value().name == "RECURSIVE") {
                // The whole replica is reported with an empty path
                paths.insert(command.value().args.empty() ? std::string() : command.value().args[0]);
            }
        }
        return paths;
    }

    fs::path testDir_;
    fs::path replica_;
    wb::FdGuard input_;
    wb::FdGuard host_;
    LineCapture out_;
    InotifyEventSource* source_{nullptr};
    std::unique_ptr<BridgeCore> bridge_;
    std::future<ExitCode> exit_;
};

TEST_F(InotifyBridgeTest, ReportsFilesInNewSubdirectory) {
    launch();

    createFile(replica_ / "a.txt", "hello");
    fs::create_directory(replica_ / "sub");
    createFile(replica_ / "sub" / "b.txt", "world");

    EXPECT_EQ(waitForChanges(), (std::set<std::string>{"a.txt", "sub/b.txt"}));
}

TEST_F(InotifyBridgeTest, RenameReportsBothNames) {
    createFile(replica_ / "x", "data");
    launch();

    fs::rename(replica_ / "x", replica_ / "y");

    EXPECT_EQ(waitForChanges(), (std::set<std::string>{"x", "y"}));
}

TEST_F(InotifyBridgeTest, RapidWritesCollapse) {
    createFile(replica_ / "f", "0");
    launch();

    createFile(replica_ / "f", "1");
    createFile(replica_ / "f", "2");

    EXPECT_EQ(waitForChanges(), std::set<std::string>{"f"});
}

TEST_F(InotifyBridgeTest, RemovedDirectoryIsReportedOnce) {
    fs::create_directories(replica_ / "gone" / "deeper");
    createFile(replica_ / "gone" / "deeper" / "file", "x");
    launch();

    fs::remove_all(replica_ / "gone");

    EXPECT_EQ(waitForChanges(), std::set<std::string>{"gone"});
}

TEST_F(InotifyBridgeTest, RemovedReplicaIsReportedAndCanBeStartedAgain) {
    fs::create_directories(replica_ / "d");
    launch();

    fs::remove_all(replica_);
    auto error = out_.next(5s);
    ASSERT_TRUE(error);
    EXPECT_EQ(error->rfind("ERROR ", 0), 0u);

    fs::create_directories(replica_);
    send("START r " + ProtocolCodec::quote(replica_.string()));
    ASSERT_EQ(out_.next(5s), std::string("OK"));
    send("DONE");
    EXPECT_GT(source_->getSubscriptionCount(), 0u);

    createFile(replica_ / "after.txt", "back");
    EXPECT_EQ(waitForChanges(), std::set<std::string>{"after.txt"});
}

TEST_F(InotifyBridgeTest, ClosingInputReleasesEveryWatch) {
    fs::create_directories(replica_ / "a" / "b");
    launch();
    ASSERT_GT(source_->getSubscriptionCount(), 0u);

    host_.reset();
    ASSERT_EQ(exit_.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(exit_.get(), ExitCode::Clean);
    EXPECT_EQ(source_->getSubscriptionCount(), 0u);
}

TEST(InotifyRetryBackoffTest, DoublesUpToACap) {
    EXPECT_EQ(InotifyEventSource::retryBackoff(50ms, 1), 50ms);
    EXPECT_EQ(InotifyEventSource::retryBackoff(50ms, 3), 200ms);

    const std::chrono::milliseconds capped = 50ms * (int64_t{1} << wb::config::MAX_READ_RETRY_DOUBLINGS);
    EXPECT_EQ(InotifyEventSource::retryBackoff(50ms, wb::config::MAX_READ_RETRY_ATTEMPTS), capped);
    EXPECT_EQ(InotifyEventSource::retryBackoff(50ms, 64), capped);
    EXPECT_EQ(InotifyEventSource::retryBackoff(50ms, 1000000), capped);
}
