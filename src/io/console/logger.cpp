#include "logger.hpp"   // for set_level, level, enabled
#include <stdexcept>    // for invalid_argument
#include <string>       // for string

namespace nvec::io::logger {
    void set_level(LogLevel level) { global::log_level = level; }

    LogLevel level() { return global::log_level; }

    bool enabled(LogLevel level)
    {
        return static_cast<int>(level) <= static_cast<int>(global::log_level);
    }

    std::string_view level_name(LogLevel level)
    {
        switch (level) {
            case LogLevel::ERROR: return "error";
            case LogLevel::WARN: return "warn";
            case LogLevel::INFO: return "info";
            case LogLevel::DEBUG: return "debug";
        }
        return "unknown";
    }

    LogLevel level_from_string(std::string_view name)
    {
        if (name == "error") {
            return LogLevel::ERROR;
        }
        if (name == "warn") {
            return LogLevel::WARN;
        }
        if (name == "info") {
            return LogLevel::INFO;
        }
        if (name == "debug") {
            return LogLevel::DEBUG;
        }
        throw std::invalid_argument(
            "unknown log level '" + std::string(name) + "'"
        );
    }
}   // namespace nvec::io::logger
