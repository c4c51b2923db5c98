#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

std::mutex Logger::mutex_;
LogLevel Logger::currentLevel_ = LogLevel::INFO;
bool Logger::initialized_ = false;
bool Logger::consoleOutput_ = true;
std::string Logger::logPath_ = "/tmp/datasync.log";

bool Logger::initialize(const std::string& logPath, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return false;
    }

    try {
        if (!logPath.empty()) {
            std::filesystem::path logDir = std::filesystem::path(logPath).parent_path();
            if (!logDir.empty() && !std::filesystem::exists(logDir)) {
                std::filesystem::create_directories(logDir);
            }

            FILE* testFile = fopen(logPath.c_str(), "a");
            if (!testFile) {
                std::cerr << "Failed to open log file " << logPath << ": " << strerror(errno) << std::endl;
                return false;
            }
            fclose(testFile);
        }

        logPath_ = logPath;
        currentLevel_ = level;
        initialized_ = true;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        return false;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    initialized_ = false;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    consoleOutput_ = enabled;
}

bool Logger::isInitialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_ || level < currentLevel_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    std::string logMessage = ss.str() + " [" + levelToString(level) + "] " + message + "\n";

    if (consoleOutput_) {
        if (level >= LogLevel::ERROR) {
            std::cerr << logMessage;
            std::cerr.flush();
        } else {
            std::cout << logMessage;
            std::cout.flush();
        }
    }

    if (logPath_.empty()) {
        return;
    }

    FILE* logFile = fopen(logPath_.c_str(), "a");
    if (logFile) {
        fprintf(logFile, "%s", logMessage.c_str());
        fclose(logFile);
    } else {
        std::cerr << "Failed to open log file: " << strerror(errno) << std::endl;
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}

bool Logger::parseLevel(const std::string& name, LogLevel& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warning" || lower == "warn") {
        level = LogLevel::WARNING;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else if (lower == "fatal") {
        level = LogLevel::FATAL;
    } else {
        return false;
    }
    return true;
}
