#include "common/subprocess.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr size_t kStderrCaptureLimit = 256 * 1024;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

std::string CommandSpec::toString() const {
    std::vector<std::string> parts;
    parts.push_back(program);
    auto redacted = utils::redactArguments(args);
    parts.insert(parts.end(), redacted.begin(), redacted.end());
    return utils::join(parts, " ");
}

Subprocess::Subprocess(CommandSpec command)
    : command_(std::move(command)) {
    stderr_.maxBytes = kStderrCaptureLimit;
}

Subprocess::~Subprocess() {
    if (pid_ > 0 && !exitCode_) {
        killGroup(SIGKILL);
        int status = 0;
        if (::waitpid(pid_, &status, 0) == pid_) {
            reap(status);
        }
    }
    joinReaders();
    closeFd(stdout_.readFd);
    closeFd(stderr_.readFd);
}

void Subprocess::redirectStdin(int fd) {
    stdinFd_ = fd;
}

void Subprocess::redirectStdout(int fd) {
    stdoutFd_ = fd;
    stdout_.capture = false;
}

void Subprocess::captureStdout(LineCallback onLine) {
    stdout_.capture = true;
    stdout_.onLine = std::move(onLine);
    stdoutFd_ = -1;
}

void Subprocess::captureStderr(LineCallback onLine) {
    stderr_.capture = true;
    stderr_.onLine = std::move(onLine);
}

bool Subprocess::start() {
    if (pid_ > 0) {
        lastError_ = "Process already started";
        return false;
    }

    std::vector<std::string> argStrings;
    argStrings.push_back(command_.program);
    argStrings.insert(argStrings.end(), command_.args.begin(), command_.args.end());
    std::vector<char*> argv;
    for (auto& arg : argStrings) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStrings = utils::buildEnvironment(command_.env);
    std::vector<char*> envp;
    for (auto& entry : envStrings) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    for (OutputStream* stream : {&stdout_, &stderr_}) {
        if (!stream->capture) {
            continue;
        }
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            lastError_ = std::string("Failed to create output pipe: ") + strerror(errno);
            closeFd(stdout_.readFd);
            closeFd(stdout_.writeFd);
            closeFd(stderr_.readFd);
            closeFd(stderr_.writeFd);
            return false;
        }
        stream->readFd = fds[0];
        stream->writeFd = fds[1];
    }

    int errorPipe[2];
    if (::pipe2(errorPipe, O_CLOEXEC) != 0) {
        lastError_ = std::string("Failed to create exec status pipe: ") + strerror(errno);
        closeFd(stdout_.readFd);
        closeFd(stdout_.writeFd);
        closeFd(stderr_.readFd);
        closeFd(stderr_.writeFd);
        return false;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        lastError_ = std::string("fork failed: ") + strerror(errno);
        ::close(errorPipe[0]);
        ::close(errorPipe[1]);
        closeFd(stdout_.readFd);
        closeFd(stdout_.writeFd);
        closeFd(stderr_.readFd);
        closeFd(stderr_.writeFd);
        return false;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::setpgid(0, 0);

        int stdinFd = stdinFd_;
        if (stdinFd < 0) {
            stdinFd = ::open("/dev/null", O_RDONLY);
        }
        if (stdinFd >= 0 && stdinFd != STDIN_FILENO) {
            ::dup2(stdinFd, STDIN_FILENO);
        }
        if (stdout_.capture) {
            ::dup2(stdout_.writeFd, STDOUT_FILENO);
        } else if (stdoutFd_ >= 0) {
            ::dup2(stdoutFd_, STDOUT_FILENO);
        }
        if (stderr_.capture) {
            ::dup2(stderr_.writeFd, STDERR_FILENO);
        }
        if (!command_.workingDirectory.empty() && ::chdir(command_.workingDirectory.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = ::write(errorPipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }

        ::execvpe(argv[0], argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = ::write(errorPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    pid_ = pid;
    ::setpgid(pid_, pid_);
    ::close(errorPipe[1]);
    closeFd(stdout_.writeFd);
    closeFd(stderr_.writeFd);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    ::close(errorPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        ::waitpid(pid_, &status, 0);
        reap(status);
        closeFd(stdout_.readFd);
        closeFd(stderr_.readFd);
        lastError_ = "Failed to execute " + command_.program + ": " + strerror(childErrno);
        Logger::error(lastError_);
        return false;
    }

    Logger::debug("Started process " + std::to_string(pid_) + ": " + command_.toString());

    if (stdout_.capture) {
        stdout_.reader = std::thread([this]() { readLoop(stdout_); });
    }
    if (stderr_.capture) {
        stderr_.reader = std::thread([this]() { readLoop(stderr_); });
    }
    return true;
}

void Subprocess::readLoop(OutputStream& stream) {
    char chunk[8192];
    std::string pending;

    while (true) {
        ssize_t n = ::read(stream.readFd, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }

        appendOutput(stream, chunk, static_cast<size_t>(n));

        if (!stream.onLine) {
            continue;
        }
        // Progress-style tools rewrite a line with '\r'; treat it as a break.
        for (ssize_t i = 0; i < n; ++i) {
            char c = chunk[i];
            if (c == '\n' || c == '\r') {
                if (!pending.empty()) {
                    stream.onLine(pending);
                    pending.clear();
                }
            } else {
                pending.push_back(c);
            }
        }
    }

    if (stream.onLine && !pending.empty()) {
        stream.onLine(pending);
    }
}

void Subprocess::appendOutput(OutputStream& stream, const char* data, size_t length) {
    std::lock_guard<std::mutex> lock(outputMutex_);
    stream.buffer.append(data, length);
    if (stream.maxBytes > 0 && stream.buffer.size() > stream.maxBytes) {
        stream.buffer.erase(0, stream.buffer.size() - stream.maxBytes);
    }
}

void Subprocess::joinReaders() {
    if (stdout_.reader.joinable()) {
        stdout_.reader.join();
    }
    if (stderr_.reader.joinable()) {
        stderr_.reader.join();
    }
}

void Subprocess::reap(int status) {
    if (WIFEXITED(status)) {
        exitCode_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exitCode_ = 128 + WTERMSIG(status);
    } else {
        exitCode_ = -1;
    }
}

void Subprocess::killGroup(int signal) {
    if (pid_ <= 0 || exitCode_) {
        return;
    }
    if (::kill(-pid_, signal) != 0) {
        ::kill(pid_, signal);
    }
}

std::optional<int> Subprocess::tryWait() {
    if (exitCode_ || pid_ <= 0) {
        return exitCode_;
    }

    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        reap(status);
    } else if (result < 0 && errno == ECHILD) {
        exitCode_ = -1;
    }
    return exitCode_;
}

void Subprocess::terminate() {
    if (pid_ <= 0 || exitCode_ || terminateRequested_) {
        return;
    }
    Logger::warning("Terminating process group " + std::to_string(pid_) + " (" + command_.program + ")");
    terminateRequested_ = true;
    terminateAt_ = std::chrono::steady_clock::now();
    killGroup(SIGTERM);
}

int Subprocess::wait(const CancellationToken* token) {
    if (pid_ <= 0) {
        return exitCode_.value_or(-1);
    }

    while (!tryWait()) {
        if (token && token->isCancelled() && !terminateRequested_) {
            terminate();
        }
        if (terminateRequested_ && !killSent_ &&
            std::chrono::steady_clock::now() - terminateAt_ >= terminateGrace_) {
            killGroup(SIGKILL);
            killSent_ = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    joinReaders();
    closeFd(stdout_.readFd);
    closeFd(stderr_.readFd);
    return *exitCode_;
}

std::string Subprocess::getStdout() const {
    std::lock_guard<std::mutex> lock(outputMutex_);
    return stdout_.buffer;
}

std::string Subprocess::getStderr() const {
    std::lock_guard<std::mutex> lock(outputMutex_);
    return stderr_.buffer;
}

ProcessResult Subprocess::run(const CommandSpec& command, const CancellationToken* token) {
    ProcessResult result;
    Subprocess process(command);
    process.captureStdout();
    process.captureStderr();

    if (!process.start()) {
        result.exitCode = 127;
        result.stderrText = process.getLastError();
        return result;
    }

    result.exitCode = process.wait(token);
    result.stdoutText = process.getStdout();
    result.stderrText = process.getStderr();
    result.cancelled = process.wasTerminated();
    return result;
}
