#include <gtest/gtest.h>
#include "common/bounded_queue.hpp"
#include "common/cancellation_token.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

TEST(UtilsTest, StringHelpers) {
    EXPECT_EQ(utils::trim("  value \r\n"), "value");
    EXPECT_EQ(utils::trim(" \t "), "");
    EXPECT_EQ(utils::toLower("PostgreSQL"), "postgresql");
    EXPECT_TRUE(utils::startsWith("rediss://host", "rediss://"));
    EXPECT_FALSE(utils::endsWith("a.json", ".yaml"));

    std::vector<std::string> parts = {"db0", "keys=3", "expires=0"};
    EXPECT_EQ(utils::split("db0,keys=3,expires=0", ','), parts);
    EXPECT_EQ(utils::join(parts, ","), "db0,keys=3,expires=0");
    EXPECT_EQ(utils::sanitizeName("s3.us-east-1"), "s3_us_east_1");
}

TEST(UtilsTest, UrlEncodeEscapesReservedCharacters) {
    EXPECT_EQ(utils::urlEncode("p@ss/word"), "p%40ss%2Fword");
    EXPECT_EQ(utils::urlEncode("plain"), "plain");
}

TEST(UtilsTest, Sha256MatchesKnownDigest) {
    EXPECT_EQ(utils::sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_THROW(utils::sha256File("/nonexistent/datasync/file"), std::runtime_error);
}

TEST(UtilsTest, GeneratedIdsAreUnique) {
    std::string first = utils::generateId();
    std::string second = utils::generateId();
    EXPECT_NE(first, second);
    EXPECT_FALSE(first.empty());
}

TEST(UtilsTest, RedactsCredentialArguments) {
    std::vector<std::string> args = {"config", "create", "remote", "s3", "secret_access_key", "abc123",
                                     "--password", "hunter2", "--password=hunter2", "-h", "db"};
    std::vector<std::string> expected = {"config", "create", "remote", "s3", "secret_access_key", "[REDACTED]",
                                         "--password", "[REDACTED]", "--password=[REDACTED]", "-h", "db"};
    EXPECT_EQ(utils::redactArguments(args), expected);
}

TEST(UtilsTest, EnvironmentOverridesWin) {
    ::setenv("DATASYNC_TEST_VAR", "inherited", 1);
    auto env = utils::buildEnvironment({{"DATASYNC_TEST_VAR", "override"}, {"DATASYNC_EXTRA", "1"}});

    int matches = 0;
    for (const auto& entry : env) {
        if (utils::startsWith(entry, "DATASYNC_TEST_VAR=")) {
            EXPECT_EQ(entry, "DATASYNC_TEST_VAR=override");
            ++matches;
        }
    }
    EXPECT_EQ(matches, 1);
    EXPECT_NE(std::find(env.begin(), env.end(), "DATASYNC_EXTRA=1"), env.end());
    ::unsetenv("DATASYNC_TEST_VAR");
}

class CancellationTokenTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = CancellationToken::create();
    }

    CancellationTokenPtr root_;
};

TEST_F(CancellationTokenTest, CancelPropagatesToChildren) {
    auto child = root_->createChild();
    auto grandchild = child->createChild();
    EXPECT_FALSE(grandchild->isCancelled());

    root_->cancel("plan cancelled");
    EXPECT_TRUE(child->isCancelled());
    EXPECT_TRUE(grandchild->isCancelled());
    EXPECT_EQ(grandchild->getReason(), "plan cancelled");

    // A second cancel keeps the first reason.
    root_->cancel("again");
    EXPECT_EQ(root_->getReason(), "plan cancelled");
}

TEST_F(CancellationTokenTest, ChildCancelDoesNotReachParent) {
    auto child = root_->createChild();
    child->cancel();
    EXPECT_TRUE(child->isCancelled());
    EXPECT_FALSE(root_->isCancelled());
}

TEST_F(CancellationTokenTest, ChildOfCancelledTokenStartsCancelled) {
    root_->cancel("shutdown");
    auto child = root_->createChild();
    EXPECT_TRUE(child->isCancelled());
    EXPECT_EQ(child->getReason(), "shutdown");
}

TEST_F(CancellationTokenTest, DeadlineCancelsWithReason) {
    root_->setDeadline(CancellationToken::Clock::now() - std::chrono::milliseconds(1));
    EXPECT_TRUE(root_->isCancelled());
    EXPECT_EQ(root_->getReason(), "deadline exceeded");
}

TEST_F(CancellationTokenTest, WaitForWakesOnCancel) {
    EXPECT_FALSE(root_->waitFor(std::chrono::milliseconds(20)));

    std::thread canceller([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        root_->cancel();
    });
    auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(root_->waitFor(std::chrono::seconds(30)));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    canceller.join();
}

TEST(BoundedQueueTest, TryPushDropsWhenFull) {
    BoundedQueue<int> queue(2);
    EXPECT_TRUE(queue.tryPush(1));
    EXPECT_TRUE(queue.tryPush(2));
    EXPECT_FALSE(queue.tryPush(3));
    EXPECT_EQ(queue.droppedCount(), 1u);

    EXPECT_EQ(queue.tryPop().value_or(0), 1);
    EXPECT_TRUE(queue.tryPush(4));
    EXPECT_EQ(queue.drain(), 2u);
    EXPECT_FALSE(queue.tryPop().has_value());
}

TEST(BoundedQueueTest, CloseDrainsRemainingItems) {
    BoundedQueue<int> queue(4);
    queue.tryPush(7);
    queue.close();

    EXPECT_FALSE(queue.tryPush(8));
    EXPECT_EQ(queue.droppedCount(), 0u);
    EXPECT_EQ(queue.pop().value_or(0), 7);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(BoundedQueueTest, BlockingPushWaitsForConsumer) {
    BoundedQueue<int> queue(1);
    queue.push(1);

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        queue.push(2);
        pushed = true;
    });

    EXPECT_FALSE(queue.pushFor(3, std::chrono::milliseconds(20)));
    EXPECT_EQ(queue.popFor(std::chrono::seconds(5)).value_or(0), 1);
    EXPECT_EQ(queue.popFor(std::chrono::seconds(5)).value_or(0), 2);
    producer.join();
    EXPECT_TRUE(pushed);
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logPath_ = std::filesystem::temp_directory_path() / ("datasync-log-" + utils::generateId()) / "test.log";
        Logger::setConsoleOutput(false);
    }

    void TearDown() override {
        Logger::shutdown();
        Logger::setConsoleOutput(true);
        std::error_code ec;
        std::filesystem::remove_all(logPath_.parent_path(), ec);
    }

    std::string readLog() {
        std::ifstream in(logPath_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::filesystem::path logPath_;
};

TEST_F(LoggerTest, WritesLinesAtOrAboveLevel) {
    Logger::info("before initialize");
    ASSERT_TRUE(Logger::initialize(logPath_.string(), LogLevel::INFO));
    EXPECT_FALSE(Logger::initialize(logPath_.string(), LogLevel::DEBUG));

    Logger::debug("hidden detail");
    Logger::warning("disk almost full");
    Logger::setLogLevel(LogLevel::DEBUG);
    Logger::debug("now visible");

    std::string content = readLog();
    EXPECT_EQ(content.find("before initialize"), std::string::npos);
    EXPECT_EQ(content.find("hidden detail"), std::string::npos);
    EXPECT_NE(content.find("[WARNING] disk almost full"), std::string::npos);
    EXPECT_NE(content.find("[DEBUG] now visible"), std::string::npos);
}

TEST_F(LoggerTest, ParsesLevelNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::parseLevel("WARN", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_TRUE(Logger::parseLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_FALSE(Logger::parseLevel("verbose", level));
    EXPECT_EQ(Logger::levelToString(LogLevel::FATAL), "FATAL");
}
