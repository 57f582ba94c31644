#include <spiral/util/logger.hpp>
#include <spiral/util/text.hpp>

namespace spiral {

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "debug";
        case LogLevel::INFO:    return "info";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR:   return "error";
    }
    return "unknown";
}

Logger& null_logger() {
    static NullLogger instance;
    return instance;
}

}  // namespace spiral
