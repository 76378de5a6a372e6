#pragma once

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace demark {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Off = 4
};

inline std::string_view to_string(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

inline std::optional<LogLevel> parse_log_level(std::string_view text)
{
    if (text == "debug") return LogLevel::Debug;
    if (text == "info") return LogLevel::Info;
    if (text == "warning" || text == "warn") return LogLevel::Warning;
    if (text == "error") return LogLevel::Error;
    if (text == "off" || text == "none") return LogLevel::Off;
    return std::nullopt;
}

// Process-wide logger. Messages go to stdout/stderr unless a callback sink
// is installed (the CLI and tests redirect through set_callback).
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static void log(LogLevel level, const std::string& message) {
        if (!enabled(level)) {
            return;
        }
        if (callback_) {
            callback_(level, message);
        } else if (level >= LogLevel::Warning) {
            std::cerr << "[DEMARK] " << to_string(level) << ": " << message << std::endl;
        } else {
            std::cout << "[DEMARK] " << message << std::endl;
        }
    }

    static void debug(const std::string& message) { log(LogLevel::Debug, message); }
    static void info(const std::string& message) { log(LogLevel::Info, message); }
    static void warning(const std::string& message) { log(LogLevel::Warning, message); }
    static void error(const std::string& message) { log(LogLevel::Error, message); }

    /// Cheap check so callers can skip building messages nobody will see
    static bool enabled(LogLevel level) {
        return level != LogLevel::Off && level >= min_level_;
    }

    static void set_level(LogLevel level) { min_level_ = level; }
    static LogLevel level() { return min_level_; }

    static void set_callback(LogCallback cb) {
        callback_ = std::move(cb);
    }

    static void clear_callback() {
        callback_ = nullptr;
    }

private:
    static inline LogCallback callback_ = nullptr;
    static inline LogLevel min_level_ = LogLevel::Info;
};

} // namespace demark
