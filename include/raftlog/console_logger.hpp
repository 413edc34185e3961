#pragma once

#include <raftlog/logger.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace raftlog {

// Console logger for development and testing.
// Thread-safe structured logging; warnings and below go to the output stream,
// errors and above to the error stream (stdout/stderr unless redirected).
class console_logger {
public:
    explicit console_logger(log_level min_level = log_level::trace)
        : _min_level(min_level) {}

    // Redirect both streams, e.g. to capture log lines in tests
    console_logger(std::ostream& out, std::ostream& err, log_level min_level = log_level::trace)
        : _min_level(min_level)
        , _out(&out)
        , _err(&err) {}

    console_logger(console_logger&& other) noexcept
        : _min_level(other._min_level)
        , _out(other._out)
        , _err(other._err) {}

    console_logger& operator=(console_logger&& other) noexcept {
        if (this != &other) {
            _min_level = other._min_level;
            _out = other._out;
            _err = other._err;
        }
        return *this;
    }

    console_logger(const console_logger&) = delete;
    console_logger& operator=(const console_logger&) = delete;

    auto log(log_level level, std::string_view message) -> void {
        log(level, message, log_fields{});
    }

    auto log(log_level level, std::string_view message, const log_fields& key_value_pairs) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        if (level < _min_level) {
            return;
        }

        auto& stream = get_stream(level);
        stream << format_timestamp() << " " << level << ": " << message;
        for (const auto& [key, value] : key_value_pairs) {
            stream << " [" << key << "=" << value << "]";
        }
        stream << "\n";
        stream.flush();
    }

    auto trace(std::string_view message) -> void { log(log_level::trace, message); }
    auto trace(std::string_view message, const log_fields& key_value_pairs) -> void {
        log(log_level::trace, message, key_value_pairs);
    }

    auto debug(std::string_view message) -> void { log(log_level::debug, message); }
    auto debug(std::string_view message, const log_fields& key_value_pairs) -> void {
        log(log_level::debug, message, key_value_pairs);
    }

    auto info(std::string_view message) -> void { log(log_level::info, message); }
    auto info(std::string_view message, const log_fields& key_value_pairs) -> void {
        log(log_level::info, message, key_value_pairs);
    }

    auto warning(std::string_view message) -> void { log(log_level::warning, message); }
    auto warning(std::string_view message, const log_fields& key_value_pairs) -> void {
        log(log_level::warning, message, key_value_pairs);
    }

    auto error(std::string_view message) -> void { log(log_level::error, message); }
    auto error(std::string_view message, const log_fields& key_value_pairs) -> void {
        log(log_level::error, message, key_value_pairs);
    }

    auto critical(std::string_view message) -> void { log(log_level::critical, message); }
    auto critical(std::string_view message, const log_fields& key_value_pairs) -> void {
        log(log_level::critical, message, key_value_pairs);
    }

    auto set_min_level(log_level level) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _min_level = level;
    }

    [[nodiscard]] auto get_min_level() const -> log_level {
        std::lock_guard<std::mutex> lock(_mutex);
        return _min_level;
    }

private:
    log_level _min_level;
    std::ostream* _out = &std::cout;
    std::ostream* _err = &std::cerr;
    mutable std::mutex _mutex;

    [[nodiscard]] auto get_stream(log_level level) const -> std::ostream& {
        if (level >= log_level::error) {
            return *_err;
        }
        return *_out;
    }

    [[nodiscard]] auto format_timestamp() const -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ) % 1000;

        std::tm local_time{};
        localtime_r(&time_t_now, &local_time);

        std::ostringstream oss;
        oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }
};

static_assert(diagnostic_logger<console_logger>,
    "console_logger must satisfy diagnostic_logger concept");

} // namespace raftlog
