#pragma once

#include <string>
#include <mutex>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

class Logger {
public:
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::INFO);
    static void shutdown();
    static void setLogLevel(LogLevel level);
    static void setConsoleOutput(bool enabled);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);
    static bool isInitialized();

    static std::string levelToString(LogLevel level);
    // Accepts "debug", "info", "warning"/"warn", "error", "fatal" in any case.
    static bool parseLevel(const std::string& name, LogLevel& level);

private:
    static void log(LogLevel level, const std::string& message);

    static std::mutex mutex_;
    static LogLevel currentLevel_;
    static bool initialized_;
    static bool consoleOutput_;
    static std::string logPath_;
};
