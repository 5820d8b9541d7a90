#pragma once

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

namespace evalbox {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static void SetLevel(LogLevel level) { level_.store(level); }
    static LogLevel GetLevel() { return level_.load(); }

    static void Log(LogLevel level, const std::string& message) {
        if (level < level_.load()) return;

        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm local_time{};
        localtime_r(&time, &local_time);

        // Warnings and errors go to stderr so they survive stdout redirection.
        std::ostream& out = level >= LogLevel::WARNING ? std::cerr : std::cout;
        out << "[" << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S") << "] ";

        switch (level) {
            case LogLevel::DEBUG: out << "[DEBUG] "; break;
            case LogLevel::INFO: out << "[INFO] "; break;
            case LogLevel::WARNING: out << "[WARN] "; break;
            case LogLevel::ERROR: out << "[ERROR] "; break;
        }

        out << "[" << std::this_thread::get_id() << "] " << message << std::endl;
    }

    template<typename... Args>
    static void Debug(Args... args) {
        if (LogLevel::DEBUG < level_.load()) return;
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::DEBUG, ss.str());
    }

    template<typename... Args>
    static void Info(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::INFO, ss.str());
    }

    template<typename... Args>
    static void Warn(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::WARNING, ss.str());
    }

    template<typename... Args>
    static void Error(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::ERROR, ss.str());
    }

private:
    static std::mutex mutex_;
    static std::atomic<LogLevel> level_;
};

inline std::mutex Logger::mutex_;
inline std::atomic<LogLevel> Logger::level_{LogLevel::INFO};

} // namespace evalbox
