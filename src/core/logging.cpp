#include "agent_runner/core/logging.hpp"
#include "agent_runner/core/utils.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace agent_runner::core {

namespace {

std::atomic<uint8_t> g_level{static_cast<uint8_t>(LogLevel::INFO)};
std::mutex g_write_mutex;

const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN ";
        case LogLevel::INFO: return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        default: return "UNKN ";
    }
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string& s) {
    const std::string l = to_lower(trim(s));
    if (l == "error") return LogLevel::ERROR;
    if (l == "warn" || l == "warning") return LogLevel::WARN;
    if (l == "info") return LogLevel::INFO;
    if (l == "debug") return LogLevel::DEBUG;
    return std::nullopt;
}

void Logger::set_level(LogLevel level) noexcept {
    g_level.store(static_cast<uint8_t>(level));
}

LogLevel Logger::level() noexcept {
    return static_cast<LogLevel>(g_level.load());
}

void Logger::log(LogLevel level, const std::string& tag,
                 const std::string& message) noexcept {
    if (static_cast<uint8_t>(level) > g_level.load()) {
        return;
    }
    try {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm tm_buf;
        localtime_r(&time_t_now, &tm_buf);

        std::ostringstream oss;
        oss << '[' << std::put_time(&tm_buf, "%H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms.count() << "] ["
            << level_to_string(level) << "] [" << tag << "] " << message;

        std::lock_guard<std::mutex> lock(g_write_mutex);
        std::cerr << oss.str() << std::endl;
    } catch (const std::exception&) {
        // logging must never throw into the caller
    }
}

} // namespace agent_runner::core
