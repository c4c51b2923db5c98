#include <gtest/gtest.h>
#include "common/process_pipeline.hpp"
#include "common/subprocess.hpp"
#include "sync/sync_error.hpp"
#include <mutex>
#include <thread>

namespace {

CommandSpec shell(const std::string& script) {
    CommandSpec command;
    command.program = "sh";
    command.args = {"-c", script};
    return command;
}

} // namespace

class SubprocessTest : public ::testing::Test {
protected:
    void SetUp() override {
        token_ = CancellationToken::create();
    }

    CancellationTokenPtr token_;
};

TEST_F(SubprocessTest, RunCollectsOutputAndExitCode) {
    ProcessResult result = Subprocess::run(shell("echo out; echo err >&2; exit 3"));
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_EQ(result.stdoutText, "out\n");
    EXPECT_EQ(result.stderrText, "err\n");
    EXPECT_FALSE(result.cancelled);
}

TEST_F(SubprocessTest, EnvironmentOverridesReachTheChild) {
    CommandSpec command = shell("printf '%s' \"$DATASYNC_PASSWORD\"");
    command.env["DATASYNC_PASSWORD"] = "s3cret";
    EXPECT_EQ(Subprocess::run(command).stdoutText, "s3cret");
}

TEST_F(SubprocessTest, LineCallbacksSplitOnCarriageReturns) {
    std::mutex mutex;
    std::vector<std::string> lines;

    Subprocess process(shell("printf '10%%\\r20%%\\rdone\\n' >&2"));
    process.captureStderr([&](const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex);
        lines.push_back(line);
    });
    ASSERT_TRUE(process.start());
    EXPECT_EQ(process.wait(), 0);

    std::vector<std::string> expected = {"10%", "20%", "done"};
    EXPECT_EQ(lines, expected);
}

TEST_F(SubprocessTest, MissingProgramFailsToStart) {
    CommandSpec command;
    command.program = "/nonexistent/datasync-tool";
    Subprocess process(command);
    EXPECT_FALSE(process.start());
    EXPECT_NE(process.getLastError().find("Failed to execute"), std::string::npos);

    EXPECT_EQ(Subprocess::run(command).exitCode, 127);
}

TEST_F(SubprocessTest, CancellationTerminatesProcessGroup) {
    Subprocess process(shell("sleep 30"));
    ASSERT_TRUE(process.start());

    std::thread canceller([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token_->cancel("stop");
    });
    auto started = std::chrono::steady_clock::now();
    int code = process.wait(token_.get());
    canceller.join();

    EXPECT_TRUE(process.wasTerminated());
    EXPECT_GE(code, 128);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST_F(SubprocessTest, ToStringRedactsSecrets) {
    CommandSpec command;
    command.program = "rclone";
    command.args = {"config", "create", "remote", "s3", "secret_access_key", "xyz"};
    EXPECT_EQ(command.toString(), "rclone config create remote s3 secret_access_key [REDACTED]");
}

TEST_F(SubprocessTest, PipelineStreamsProducerIntoConsumer) {
    ProcessPipeline pipeline(shell("printf 'a\\nb\\nc\\n'"), shell("test \"$(wc -l)\" -eq 3"));
    ProcessPipeline::Result result = pipeline.run(token_.get());
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.producerExit, 0);
    EXPECT_EQ(result.consumerExit, 0);
}

TEST_F(SubprocessTest, PipelineReportsProducerFailure) {
    ProcessPipeline pipeline(shell("echo 'access denied' >&2; exit 1"), shell("cat > /dev/null"));
    ProcessPipeline::Result result = pipeline.run(token_.get());

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.producerExit, 1);
    EXPECT_EQ(result.consumerExit, 0);
    EXPECT_EQ(result.describeFailure("pg_dump", "pg_restore"), "pg_dump exited with status 1: access denied");
}

TEST_F(SubprocessTest, PipelineCancellationStopsBothSides) {
    ProcessPipeline pipeline(shell("sleep 30"), shell("cat > /dev/null"));
    std::thread canceller([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token_->cancel("stop");
    });

    ProcessPipeline::Result result = pipeline.run(token_.get());
    canceller.join();
    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.succeeded());
    EXPECT_LT(result.elapsed, std::chrono::seconds(10));
}

TEST_F(SubprocessTest, PipelineThrowsWhenProgramIsMissing) {
    CommandSpec missing;
    missing.program = "/nonexistent/datasync-tool";
    ProcessPipeline pipeline(missing, shell("cat > /dev/null"));
    try {
        pipeline.run(token_.get());
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.getCategory(), SyncError::Category::TRANSFER);
    }
}
