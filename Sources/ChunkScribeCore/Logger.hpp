#pragma once

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace cs {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/// Thread-safe singleton logger. Writes to stderr and, once open_file()
/// succeeds, to a log file as well.
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);

        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        ss << " [" << level_to_string(level) << "] " << message << '\n';

        if (file_.is_open()) {
            file_ << ss.str();
            file_.flush();
        }
        if (to_stderr_) {
            std::cerr << ss.str();
        }
    }

    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warning(const std::string& message) { log(LogLevel::Warning, message); }
    void error(const std::string& message) { log(LogLevel::Error, message); }

    /// Append to `path` in addition to stderr. Returns false if it cannot be opened.
    bool open_file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    void set_stderr(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        to_stderr_ = enabled;
    }

    /// "debug", "info", "warning"/"warn", "error"; anything else is Info.
    static LogLevel level_from_string(const std::string& s) {
        if (s == "debug")                  return LogLevel::Debug;
        if (s == "warning" || s == "warn") return LogLevel::Warning;
        if (s == "error")                  return LogLevel::Error;
        return LogLevel::Info;
    }

private:
    Logger() = default;

    ~Logger() {
        if (file_.is_open()) {
            file_.close();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static const char* level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "UNKNOWN";
    }

    std::ofstream file_;
    std::mutex    mutex_;
    LogLevel      min_level_ = LogLevel::Info;
    bool          to_stderr_ = true;
};

} // namespace cs

// Convenience macros
#define CS_LOG_DEBUG(msg)   ::cs::Logger::instance().debug(msg)
#define CS_LOG_INFO(msg)    ::cs::Logger::instance().info(msg)
#define CS_LOG_WARNING(msg) ::cs::Logger::instance().warning(msg)
#define CS_LOG_ERROR(msg)   ::cs::Logger::instance().error(msg)
