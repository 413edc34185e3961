#pragma once

#include <boost/json.hpp>

#include <concepts>
#include <functional>
#include <optional>
#include <ostream>
#include <string_view>

namespace raftlog {

// Application command concept.
// A custom command names its own wire tag, encodes itself, and supports
// structural equality and debug rendering. Decoding happens before any
// instance exists, so it lives in a registry (see command_decoder_registry).
template<typename T>
concept custom_command = std::equality_comparable<T> && requires(const T& command, std::ostream& os) {
    { command.command_type() } -> std::convertible_to<std::string_view>;
    { command.to_json() } -> std::convertible_to<boost::json::value>;
    { os << command } -> std::same_as<std::ostream&>;
};

// Builds a custom command from the body stored under "command"
template<typename T>
using command_decoder = std::function<T(const boost::json::value&)>;

// Tag -> decoder lookup consulted for every non built-in tag.
// Lookups happen concurrently from decoding threads; implementations must allow that.
template<typename R, typename T>
concept command_decoder_registry = requires(const R& registry, std::string_view command_type) {
    requires custom_command<T>;
    { registry.resolve(command_type) } -> std::same_as<std::optional<command_decoder<T>>>;
};

} // namespace raftlog
