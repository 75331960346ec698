#pragma once

// ============================================================
// logger.hpp -- Thread-safe logger
//
// Lines are "<timestamp> [LEVEL] message"; components tag their own
// messages ("[index:old] ..."). The level is atomic so indexing threads
// can test it per entry without locking.
// ============================================================

#include "platform.hpp"
#include <atomic>
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
    LogLevel level() const { return level_.load(std::memory_order_relaxed); }
    bool enabled(LogLevel lvl) const { return lvl >= level(); }

    // Append log lines to a file in addition to the console.
    // Throws if the file cannot be opened; any previous file is detached.
    void set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
        if (!file_.is_open()) {
            throw std::runtime_error("Cannot open log file: " + path);
        }
    }

    void log(LogLevel lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        std::string line = format_line(lvl, msg);
        std::lock_guard<std::mutex> lk(mutex_);
        if (lvl >= LogLevel::WARN) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
    }

    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR,  msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;

    static std::string format_line(LogLevel lvl, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        ss << " [" << level_str(lvl) << "] " << msg;
        return ss.str();
    }

    static const char* level_str(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
        }
        return "?????";
    }

    std::mutex            mutex_;  // guards console and file output
    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::ofstream         file_;
};

// Convenience macros
#define LOG_INFO(msg)  Logger::get().info(msg)
#define LOG_WARN(msg)  Logger::get().warn(msg)
#define LOG_ERROR(msg) Logger::get().error(msg)
#define LOG_DEBUG(msg) Logger::get().debug(msg)

// Skips building the message when DEBUG is off (index dumps can be large)
#define LOG_DEBUG_ENABLED() Logger::get().enabled(LogLevel::DEBUG)
