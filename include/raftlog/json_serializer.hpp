#pragma once

#include <raftlog/command.hpp>
#include <raftlog/console_logger.hpp>
#include <raftlog/custom_command.hpp>
#include <raftlog/exceptions.hpp>
#include <raftlog/log_entry.hpp>
#include <raftlog/logger.hpp>
#include <raftlog/serializer_config.hpp>
#include <raftlog/types.hpp>

#include <boost/json.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace raftlog {

// JSON log entry serializer.
// Turns entries and commands into canonical JSON bytes and back. The registry
// is owned by the embedding application and must outlive the serializer.
template<
    typename Custom,
    typename Registry,
    typename Logger = console_logger,
    typename NodeId = std::uint64_t,
    typename TermId = std::uint64_t,
    typename Data = std::vector<std::byte>
>
requires custom_command<Custom>
    && command_decoder_registry<Registry, Custom>
    && diagnostic_logger<Logger>
    && node_id<NodeId>
    && term_id<TermId>
    && serialized_data<Data>
class json_log_entry_serializer {
public:
    using entry_type = log_entry<Custom, NodeId, TermId>;
    using command_value_type = command<Custom, NodeId>;
    using data_type = Data;

    explicit json_log_entry_serializer(
        const Registry& registry,
        Logger logger = Logger{},
        json_serializer_config config = {}
    )
        : _registry(registry)
        , _logger(std::move(logger))
        , _config(config) {
        validate_serializer_config(_config);
    }

    auto serialize(const entry_type& entry) const -> Data {
        return json_to_bytes(boost::json::serialize(entry.to_json()));
    }

    // Standalone command envelope: {"command": body, "type": tag}
    auto serialize(const command_value_type& cmd) const -> Data {
        boost::json::object obj;
        obj[fields::command] = cmd.to_json();
        obj[fields::type] = boost::json::string(cmd.command_type());
        return json_to_bytes(boost::json::serialize(obj));
    }

    // Batch of entries as a JSON array, in log order
    auto serialize(const std::vector<entry_type>& entries) const -> Data {
        if (entries.size() > _config.max_batch_entries) {
            throw serialization_exception(std::format(
                "Batch of {} entries exceeds the limit of {}", entries.size(), _config.max_batch_entries));
        }

        boost::json::array entries_array;
        entries_array.reserve(entries.size());
        for (const auto& entry : entries) {
            entries_array.push_back(entry.to_json());
        }
        return json_to_bytes(boost::json::serialize(entries_array));
    }

    // Lenient: only unreadable bytes throw; a bad command is dropped and logged
    auto deserialize_log_entry(const Data& data) const -> entry_type {
        auto value = parse(data, "log entry");
        return entry_type::from_json(value, _registry, _logger, _config.dropped_command_log_level);
    }

    // Strict: command_decode_error subtypes and decoder failures propagate
    auto deserialize_command(const Data& data) const -> command_value_type {
        auto value = parse(data, "command");
        return command_value_type::from_json(value, _registry);
    }

    auto deserialize_log_entries(const Data& data) const -> std::vector<entry_type> {
        auto value = parse(data, "log entry batch");
        if (!value.is_array()) {
            _logger.warning("Rejected log entry batch", {{"reason", "not a JSON array"}});
            throw serialization_exception("Log entry batch is not a JSON array");
        }

        const auto& entries_array = value.get_array();
        if (entries_array.size() > _config.max_batch_entries) {
            auto count = std::to_string(entries_array.size());
            _logger.warning("Rejected log entry batch", {
                {"reason", "too many entries"},
                {"entries", count}
            });
            throw serialization_exception(std::format(
                "Batch of {} entries exceeds the limit of {}", entries_array.size(), _config.max_batch_entries));
        }

        std::vector<entry_type> entries;
        entries.reserve(entries_array.size());
        for (const auto& entry_val : entries_array) {
            entries.push_back(entry_type::from_json(entry_val, _registry, _logger, _config.dropped_command_log_level));
        }
        return entries;
    }

    auto config() const -> const json_serializer_config& {
        return _config;
    }

private:
    const Registry& _registry;
    mutable Logger _logger;
    json_serializer_config _config;

    auto parse(const Data& data, std::string_view what) const -> boost::json::value {
        auto size = static_cast<std::size_t>(std::ranges::distance(data));
        if (size > _config.max_message_size) {
            auto size_text = std::to_string(size);
            _logger.warning("Rejected oversized payload", {
                {"payload", what},
                {"bytes", size_text}
            });
            throw serialization_exception(std::format(
                "{} of {} bytes exceeds the limit of {} bytes", what, size, _config.max_message_size));
        }

        boost::json::error_code ec;
        auto value = boost::json::parse(bytes_to_string(data), ec);
        if (ec) {
            auto reason = ec.message();
            _logger.warning("Rejected malformed payload", {
                {"payload", what},
                {"reason", reason}
            });
            throw serialization_exception(std::format("Malformed {} JSON: {}", what, reason));
        }
        return value;
    }

    auto json_to_bytes(const std::string& json_str) const -> Data {
        Data result;
        if constexpr (requires { result.resize(0); }) {
            result.resize(json_str.size());
            std::transform(json_str.begin(), json_str.end(), result.begin(),
                          [](char c) { return static_cast<std::byte>(c); });
        }
        return result;
    }

    auto bytes_to_string(const Data& data) const -> std::string {
        std::string result;
        result.reserve(static_cast<std::size_t>(std::ranges::distance(data)));
        for (auto b : data) {
            result.push_back(static_cast<char>(b));
        }
        return result;
    }
};

} // namespace raftlog
