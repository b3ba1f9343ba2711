#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace agent_runner::core {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

std::optional<LogLevel> parse_log_level(const std::string& s);

// Diagnostics go to stderr as "[time] [LEVEL] [tag] message"; stdout is
// reserved for the JSONL event stream.
class Logger {
public:
    static void set_level(LogLevel level) noexcept;
    static LogLevel level() noexcept;

    static void log(LogLevel level, const std::string& tag,
                    const std::string& message) noexcept;

    static void error(const std::string& tag, const std::string& msg) noexcept {
        log(LogLevel::ERROR, tag, msg);
    }
    static void warn(const std::string& tag, const std::string& msg) noexcept {
        log(LogLevel::WARN, tag, msg);
    }
    static void info(const std::string& tag, const std::string& msg) noexcept {
        log(LogLevel::INFO, tag, msg);
    }
    static void debug(const std::string& tag, const std::string& msg) noexcept {
        log(LogLevel::DEBUG, tag, msg);
    }
};

} // namespace agent_runner::core
