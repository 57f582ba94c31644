#pragma once

#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace spiral {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

/**
 * Parse a log level name ("debug", "info", "warning"/"warn", "error").
 * Case-insensitive. Returns nullopt for anything else.
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

const char* log_level_name(LogLevel level);

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

    // Callers check this before formatting expensive trace messages
    bool enabled(LogLevel level) const { return level >= min_level_; }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel get_min_level() const { return min_level_; }

protected:
    LogLevel min_level_ = LogLevel::INFO;
};

// Writes to stderr so that split output on stdout stays machine-readable
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(std::ostream& out = std::cerr) : out_(out) {}

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
        out_ << prefix << message << std::endl;
    }

private:
    std::ostream& out_;
    std::mutex mutex_;
};

class NullLogger : public Logger {
public:
    NullLogger() { min_level_ = LogLevel::ERROR; }
    void log(LogLevel, const std::string&) override {}
};

// Shared sink used when a component is constructed without a logger
Logger& null_logger();

}  // namespace spiral
