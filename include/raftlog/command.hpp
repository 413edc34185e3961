#pragma once

#include <raftlog/custom_command.hpp>
#include <raftlog/exceptions.hpp>
#include <raftlog/types.hpp>

#include <boost/json.hpp>

#include <algorithm>
#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace raftlog {

// One-step membership change from old_configuration to configuration
template<typename NodeId = std::uint64_t>
requires node_id<NodeId>
struct single_configuration {
    node_set<NodeId> _old_configuration;
    node_set<NodeId> _configuration;

    auto old_configuration() const -> const node_set<NodeId>& { return _old_configuration; }
    auto configuration() const -> const node_set<NodeId>& { return _configuration; }

    auto operator==(const single_configuration&) const -> bool = default;
};

// Joint consensus phase: a quorum is required in both member sets
template<typename NodeId = std::uint64_t>
requires node_id<NodeId>
struct joint_configuration {
    node_set<NodeId> _old_configuration;
    node_set<NodeId> _new_configuration;

    auto old_configuration() const -> const node_set<NodeId>& { return _old_configuration; }
    auto new_configuration() const -> const node_set<NodeId>& { return _new_configuration; }

    auto operator==(const joint_configuration&) const -> bool = default;
};

namespace detail {

template<typename NodeId>
auto sorted_members(const node_set<NodeId>& members) -> std::vector<NodeId> {
    std::vector<NodeId> sorted(members.begin(), members.end());
    std::ranges::sort(sorted);
    return sorted;
}

// {"instanceIds": [ascending ids]}
template<typename NodeId>
auto encode_instance_ids(const node_set<NodeId>& members) -> boost::json::object {
    boost::json::array ids;
    ids.reserve(members.size());
    for (auto id : sorted_members<NodeId>(members)) {
        ids.emplace_back(static_cast<std::uint64_t>(id));
    }

    boost::json::object obj;
    obj[fields::instance_ids] = std::move(ids);
    return obj;
}

// Non-negative integer that fits in Unsigned, whichever JSON number kind holds it
template<typename Unsigned>
requires std::unsigned_integral<Unsigned>
auto as_unsigned(const boost::json::value& value) -> std::optional<Unsigned> {
    std::uint64_t raw = 0;
    if (value.is_uint64()) {
        raw = value.get_uint64();
    } else if (value.is_int64() && value.get_int64() >= 0) {
        raw = static_cast<std::uint64_t>(value.get_int64());
    } else {
        return std::nullopt;
    }

    if (raw > std::numeric_limits<Unsigned>::max()) {
        return std::nullopt;
    }
    return static_cast<Unsigned>(raw);
}

// Absent sub-objects and absent arrays mean "no members"; stray elements are skipped
template<typename NodeId>
auto decode_instance_ids(const boost::json::value* configuration) -> node_set<NodeId> {
    node_set<NodeId> members;
    if (configuration == nullptr || !configuration->is_object()) {
        return members;
    }

    const auto* ids = configuration->get_object().if_contains(fields::instance_ids);
    if (ids == nullptr || !ids->is_array()) {
        return members;
    }

    for (const auto& id : ids->get_array()) {
        if (auto member = as_unsigned<NodeId>(id)) {
            members.insert(*member);
        }
    }
    return members;
}

inline auto find_member(const boost::json::value& body, boost::json::string_view key) -> const boost::json::value* {
    if (!body.is_object()) {
        return nullptr;
    }
    return body.get_object().if_contains(key);
}

template<typename NodeId>
auto print_members(std::ostream& os, const node_set<NodeId>& members) -> std::ostream& {
    os << '{';
    bool first = true;
    for (auto id : sorted_members<NodeId>(members)) {
        if (!first) {
            os << ", ";
        }
        os << static_cast<std::uint64_t>(id);
        first = false;
    }
    return os << '}';
}

} // namespace detail

// Replicated command: a built-in membership change or one application command
template<typename Custom, typename NodeId = std::uint64_t>
requires custom_command<Custom> && node_id<NodeId>
class command {
public:
    using custom_type = Custom;
    using node_id_type = NodeId;
    using single_configuration_type = single_configuration<NodeId>;
    using joint_configuration_type = joint_configuration<NodeId>;

    command(single_configuration_type body) : _body(std::move(body)) {}
    command(joint_configuration_type body) : _body(std::move(body)) {}
    command(Custom body) : _body(std::move(body)) {}

    static auto single(node_set<NodeId> old_configuration, node_set<NodeId> configuration) -> command {
        return command{single_configuration_type{std::move(old_configuration), std::move(configuration)}};
    }

    static auto joint(node_set<NodeId> old_configuration, node_set<NodeId> new_configuration) -> command {
        return command{joint_configuration_type{std::move(old_configuration), std::move(new_configuration)}};
    }

    auto is_single_configuration() const -> bool {
        return std::holds_alternative<single_configuration_type>(_body);
    }

    auto is_joint_configuration() const -> bool {
        return std::holds_alternative<joint_configuration_type>(_body);
    }

    auto is_custom() const -> bool {
        return std::holds_alternative<Custom>(_body);
    }

    auto is_configuration_change() const -> bool {
        return !is_custom();
    }

    // Accessors throw std::bad_variant_access when another alternative is held
    auto as_single_configuration() const -> const single_configuration_type& {
        return std::get<single_configuration_type>(_body);
    }

    auto as_joint_configuration() const -> const joint_configuration_type& {
        return std::get<joint_configuration_type>(_body);
    }

    auto as_custom() const -> const Custom& {
        return std::get<Custom>(_body);
    }

    // Wire tag, also the registry key for custom commands
    auto command_type() const -> std::string {
        if (is_single_configuration()) {
            return std::string{single_configuration_tag};
        }
        if (is_joint_configuration()) {
            return std::string{joint_configuration_tag};
        }
        return std::string{std::string_view{as_custom().command_type()}};
    }

    // Command body; keys are written in ascending order
    auto to_json() const -> boost::json::value {
        if (const auto* single_body = std::get_if<single_configuration_type>(&_body)) {
            boost::json::object obj;
            obj[fields::configuration] = detail::encode_instance_ids<NodeId>(single_body->configuration());
            obj[fields::old_configuration] = detail::encode_instance_ids<NodeId>(single_body->old_configuration());
            return obj;
        }

        if (const auto* joint_body = std::get_if<joint_configuration_type>(&_body)) {
            boost::json::object obj;
            obj[fields::new_configuration] = detail::encode_instance_ids<NodeId>(joint_body->new_configuration());
            obj[fields::old_configuration] = detail::encode_instance_ids<NodeId>(joint_body->old_configuration());
            return obj;
        }

        const auto& custom = as_custom();
        const std::string tag{std::string_view{custom.command_type()}};
        if (is_reserved_command_type(tag)) {
            throw serialization_exception(std::format(
                "Custom command claims reserved command type \"{}\"", tag));
        }
        return custom.to_json();
    }

    // Decode from a value carrying "type" and "command" members.
    // Strict: every failure is thrown to the caller.
    template<typename Registry>
    requires command_decoder_registry<Registry, Custom>
    static auto from_json(const boost::json::value& value, const Registry& registry) -> command {
        const auto* type = detail::find_member(value, fields::type);
        if (type == nullptr || !type->is_string()) {
            throw missing_type_error();
        }

        const auto& type_name = type->get_string();
        std::string_view tag{type_name.data(), type_name.size()};
        const auto* body = detail::find_member(value, fields::command);

        if (tag == single_configuration_tag) {
            if (body == nullptr) {
                throw malformed_command_error(std::format("{} command has no \"command\" body", tag));
            }
            return command{single_configuration_type{
                detail::decode_instance_ids<NodeId>(detail::find_member(*body, fields::old_configuration)),
                detail::decode_instance_ids<NodeId>(detail::find_member(*body, fields::configuration))
            }};
        }

        if (tag == joint_configuration_tag) {
            if (body == nullptr) {
                throw malformed_command_error(std::format("{} command has no \"command\" body", tag));
            }
            return command{joint_configuration_type{
                detail::decode_instance_ids<NodeId>(detail::find_member(*body, fields::old_configuration)),
                detail::decode_instance_ids<NodeId>(detail::find_member(*body, fields::new_configuration))
            }};
        }

        auto decoder = registry.resolve(tag);
        if (!decoder) {
            throw unknown_command_type_error(std::string{tag});
        }
        static const boost::json::value null_body;
        return command{(*decoder)(body != nullptr ? *body : null_body)};
    }

    auto operator==(const command&) const -> bool = default;

    friend auto operator<<(std::ostream& os, const command& cmd) -> std::ostream& {
        if (const auto* single_body = std::get_if<single_configuration_type>(&cmd._body)) {
            os << single_configuration_tag << '(';
            detail::print_members<NodeId>(os, single_body->old_configuration());
            os << " -> ";
            detail::print_members<NodeId>(os, single_body->configuration());
            return os << ')';
        }

        if (const auto* joint_body = std::get_if<joint_configuration_type>(&cmd._body)) {
            os << joint_configuration_tag << '(';
            detail::print_members<NodeId>(os, joint_body->old_configuration());
            os << " -> ";
            detail::print_members<NodeId>(os, joint_body->new_configuration());
            return os << ')';
        }

        return os << cmd.as_custom();
    }

private:
    std::variant<single_configuration_type, joint_configuration_type, Custom> _body;
};

} // namespace raftlog
