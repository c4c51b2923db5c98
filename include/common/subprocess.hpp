#pragma once

#include "common/cancellation_token.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

struct CommandSpec {
    std::string program;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string workingDirectory;

    // Program and arguments joined with spaces, credentials redacted.
    std::string toString() const;
};

struct ProcessResult {
    int exitCode{-1};
    std::string stdoutText;
    std::string stderrText;
    bool cancelled{false};
};

// A child process started with fork/exec in its own process group.
// Standard input defaults to /dev/null; output streams are inherited unless
// redirected to a descriptor or captured through a pipe.
class Subprocess {
public:
    using LineCallback = std::function<void(const std::string& line)>;

    explicit Subprocess(CommandSpec command);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // Stream wiring, valid before start(). Descriptors stay owned by the caller.
    void redirectStdin(int fd);
    void redirectStdout(int fd);
    void captureStdout(LineCallback onLine = nullptr);
    void captureStderr(LineCallback onLine = nullptr);

    bool start();
    bool isStarted() const { return pid_ > 0; }
    pid_t getPid() const { return pid_; }

    // Non-blocking check; returns the exit code once the process is reaped.
    std::optional<int> tryWait();

    // Blocks until exit. When `token` fires, the process group receives
    // SIGTERM and, after the grace period, SIGKILL. Signalled processes
    // report 128 + signal number.
    int wait(const CancellationToken* token = nullptr);

    // Sends SIGTERM to the process group; wait() escalates to SIGKILL.
    void terminate();
    void setTerminateGrace(std::chrono::milliseconds grace) { terminateGrace_ = grace; }
    bool wasTerminated() const { return terminateRequested_; }

    std::string getStdout() const;
    std::string getStderr() const;
    std::string getLastError() const { return lastError_; }
    const CommandSpec& getCommand() const { return command_; }

    // Starts, waits and collects both output streams.
    static ProcessResult run(const CommandSpec& command, const CancellationToken* token = nullptr);

private:
    struct OutputStream {
        bool capture{false};
        LineCallback onLine;
        int readFd{-1};
        int writeFd{-1};
        std::string buffer;
        size_t maxBytes{0};
        std::thread reader;
    };

    void readLoop(OutputStream& stream);
    void appendOutput(OutputStream& stream, const char* data, size_t length);
    void joinReaders();
    void reap(int status);
    void killGroup(int signal);

    CommandSpec command_;
    pid_t pid_{-1};
    int stdinFd_{-1};
    int stdoutFd_{-1};
    OutputStream stdout_;
    OutputStream stderr_;
    mutable std::mutex outputMutex_;
    std::optional<int> exitCode_;
    bool terminateRequested_{false};
    bool killSent_{false};
    std::chrono::steady_clock::time_point terminateAt_;
    std::chrono::milliseconds terminateGrace_{2000};
    std::string lastError_;
};
