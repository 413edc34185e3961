#pragma once

#include <raftlog/exceptions.hpp>
#include <raftlog/logger.hpp>

#include <cstddef>

namespace raftlog {

// Limits and reporting policy for json_log_entry_serializer
struct json_serializer_config {
    std::size_t max_message_size{16 * 1024 * 1024};  // 16 MB
    std::size_t max_batch_entries{10000};
    log_level dropped_command_log_level{log_level::warning};
};

inline auto validate_serializer_config(const json_serializer_config& config) -> void {
    if (config.max_message_size == 0) {
        throw configuration_exception("max_message_size must be greater than 0");
    }

    if (config.max_batch_entries == 0) {
        throw configuration_exception("max_batch_entries must be greater than 0");
    }

    if (config.dropped_command_log_level > log_level::critical) {
        throw configuration_exception("dropped_command_log_level is not a valid log level");
    }
}

} // namespace raftlog
