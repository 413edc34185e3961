#pragma once

#include <raftlog/command.hpp>
#include <raftlog/command_registry.hpp>

#include <boost/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace raftlog::examples {

inline constexpr std::string_view put_command_type = "KeyValuePut";
inline constexpr std::string_view erase_command_type = "KeyValueErase";

// Application command for a replicated key-value store.
// One C++ type carrying two wire tags: PUT <key> <value> and ERASE <key>.
struct key_value_command {
    enum class operation : std::uint8_t {
        put,
        erase
    };

    operation _operation{operation::put};
    std::string _key;
    std::string _value;

    static auto put(std::string key, std::string value) -> key_value_command {
        return {operation::put, std::move(key), std::move(value)};
    }

    static auto erase(std::string key) -> key_value_command {
        return {operation::erase, std::move(key), {}};
    }

    auto command_type() const -> std::string_view {
        return _operation == operation::put ? put_command_type : erase_command_type;
    }

    auto to_json() const -> boost::json::value {
        boost::json::object obj;
        obj["key"] = boost::json::string(_key);
        if (_operation == operation::put) {
            obj["value"] = boost::json::string(_value);
        }
        return obj;
    }

    static auto decode_put(const boost::json::value& body) -> key_value_command {
        return put(read_string(body, "key"), read_string(body, "value"));
    }

    static auto decode_erase(const boost::json::value& body) -> key_value_command {
        return erase(read_string(body, "key"));
    }

    auto operator==(const key_value_command&) const -> bool = default;

    friend auto operator<<(std::ostream& os, const key_value_command& cmd) -> std::ostream& {
        if (cmd._operation == operation::put) {
            return os << "PUT(" << cmd._key << " = " << cmd._value << ")";
        }
        return os << "ERASE(" << cmd._key << ")";
    }

private:
    static auto read_string(const boost::json::value& body, const char* field) -> std::string {
        const auto* member = body.is_object() ? body.get_object().if_contains(field) : nullptr;
        if (member == nullptr || !member->is_string()) {
            throw std::invalid_argument(std::string("key-value command is missing string field ") + field);
        }
        const auto& text = member->get_string();
        return std::string(text.data(), text.size());
    }
};

template<typename Logger>
auto register_key_value_commands(command_registry<key_value_command, Logger>& registry) -> void {
    registry.register_decoder(std::string{put_command_type}, &key_value_command::decode_put);
    registry.register_decoder(std::string{erase_command_type}, &key_value_command::decode_erase);
}

// Applies committed key-value commands; membership commands are not its concern
class key_value_store {
public:
    template<typename NodeId>
    auto apply(const command<key_value_command, NodeId>& cmd) -> void {
        if (!cmd.is_custom()) {
            return;
        }

        const auto& kv = cmd.as_custom();
        if (kv._operation == key_value_command::operation::put) {
            _data[kv._key] = kv._value;
        } else {
            _data.erase(kv._key);
        }
    }

    auto get(const std::string& key) const -> std::optional<std::string> {
        auto it = _data.find(key);
        if (it == _data.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto size() const -> std::size_t { return _data.size(); }

private:
    std::map<std::string, std::string> _data;
};

} // namespace raftlog::examples
