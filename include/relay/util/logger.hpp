#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace relay {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel get_min_level() const { return min_level_; }

    bool enabled(LogLevel level) const { return level >= min_level_; }

protected:
    LogLevel min_level_ = LogLevel::INFO;
};

// Writes to stderr so stdout stays clean for command output.
class ConsoleLogger : public Logger {
public:
    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;

        const char* prefix = "";
        switch (level) {
            case LogLevel::DEBUG:   prefix = "[DEBUG] "; break;
            case LogLevel::INFO:    prefix = "[INFO] "; break;
            case LogLevel::WARNING: prefix = "[WARN] "; break;
            case LogLevel::ERROR:   prefix = "[ERROR] "; break;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << prefix << message << std::endl;
    }

private:
    std::mutex mutex_;
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&) override {}
};

/**
 * Install the process-wide logger used by the routing core.
 * Passing nullptr restores the default NullLogger.
 */
void set_logger(std::shared_ptr<Logger> logger);

/**
 * Access the process-wide logger. Never null.
 */
std::shared_ptr<Logger> logger();

/**
 * Parse "debug", "info", "warning"/"warn" or "error" (case-insensitive).
 * Unknown names map to INFO.
 */
LogLevel parse_log_level(const std::string& name);

}  // namespace relay
