#pragma once

#include <concepts>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <utility>
#include <vector>

namespace raftlog {

// Log severity levels
enum class log_level : std::uint8_t {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

// Structured key/value annotations attached to a log message
using log_fields = std::vector<std::pair<std::string_view, std::string_view>>;

constexpr auto to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace:    return "TRACE";
        case log_level::debug:    return "DEBUG";
        case log_level::info:     return "INFO";
        case log_level::warning:  return "WARNING";
        case log_level::error:    return "ERROR";
        case log_level::critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

inline auto operator<<(std::ostream& os, log_level level) -> std::ostream& {
    return os << to_string(level);
}

// Diagnostic logger concept for structured logging
template<typename L>
concept diagnostic_logger = requires(
    L logger,
    log_level level,
    std::string_view message,
    log_fields key_value_pairs
) {
    { logger.log(level, message) } -> std::same_as<void>;
    { logger.log(level, message, key_value_pairs) } -> std::same_as<void>;

    { logger.trace(message) } -> std::same_as<void>;
    { logger.debug(message) } -> std::same_as<void>;
    { logger.info(message) } -> std::same_as<void>;
    { logger.warning(message) } -> std::same_as<void>;
    { logger.error(message) } -> std::same_as<void>;
    { logger.critical(message) } -> std::same_as<void>;
};

} // namespace raftlog
