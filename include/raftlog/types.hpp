#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <string_view>
#include <unordered_set>

namespace raftlog {

// Node identifier concept - cluster members are addressed by unsigned integers
template<typename T>
concept node_id = std::unsigned_integral<T>;

// Term number concept (monotonically increasing unsigned integer)
template<typename T>
concept term_id = std::unsigned_integral<T>;

// Set of cluster members. Carries no order; encoders sort before writing.
template<typename NodeId = std::uint64_t>
requires node_id<NodeId>
using node_set = std::unordered_set<NodeId>;

// Serialized data concept - must be a range of std::byte
template<typename T>
concept serialized_data = std::ranges::range<T> &&
    std::same_as<std::ranges::range_value_t<T>, std::byte>;

// Wire tags of the built-in membership commands
inline constexpr std::string_view single_configuration_tag = "SingleConfiguration";
inline constexpr std::string_view joint_configuration_tag = "JointConfiguration";

// Built-in tags are reserved and may never be claimed by a custom command
constexpr auto is_reserved_command_type(std::string_view type) -> bool {
    return type == single_configuration_tag || type == joint_configuration_tag;
}

// Wire field names
namespace fields {
    inline constexpr const char* type = "type";
    inline constexpr const char* term = "term";
    inline constexpr const char* command = "command";
    inline constexpr const char* configuration = "configuration";
    inline constexpr const char* old_configuration = "oldConfiguration";
    inline constexpr const char* new_configuration = "newConfiguration";
    inline constexpr const char* instance_ids = "instanceIds";
} // namespace fields

} // namespace raftlog
