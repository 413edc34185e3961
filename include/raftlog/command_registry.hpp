#pragma once

#include <raftlog/console_logger.hpp>
#include <raftlog/custom_command.hpp>
#include <raftlog/exceptions.hpp>
#include <raftlog/logger.hpp>
#include <raftlog/types.hpp>

#include <cstddef>
#include <format>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace raftlog {

// Default tag -> decoder registry.
// Populated by the embedding application before decoding starts; resolve()
// takes a shared lock so any number of decoding threads may look up tags.
template<typename Custom, typename Logger = console_logger>
requires custom_command<Custom> && diagnostic_logger<Logger>
class command_registry {
public:
    using custom_type = Custom;
    using decoder_type = command_decoder<Custom>;

    explicit command_registry(Logger logger = Logger{})
        : _logger(std::move(logger)) {}

    command_registry(const command_registry&) = delete;
    command_registry& operator=(const command_registry&) = delete;

    // Register the decoder for a custom tag, replacing any earlier registration
    auto register_decoder(std::string command_type, decoder_type decoder) -> void {
        if (command_type.empty()) {
            throw registry_exception("Cannot register a decoder for an empty command type");
        }
        if (is_reserved_command_type(command_type)) {
            throw registry_exception(std::format(
                "Command type \"{}\" is reserved for built-in membership commands", command_type));
        }
        if (!decoder) {
            throw registry_exception(std::format(
                "Cannot register an empty decoder for command type \"{}\"", command_type));
        }

        bool replaced = false;
        {
            std::unique_lock lock(_mutex);
            auto [it, inserted] = _decoders.insert_or_assign(command_type, std::move(decoder));
            replaced = !inserted;
        }

        if (replaced) {
            _logger.warning("Replaced custom command decoder", {{"command_type", command_type}});
        } else {
            _logger.debug("Registered custom command decoder", {{"command_type", command_type}});
        }
    }

    [[nodiscard]] auto resolve(std::string_view command_type) const -> std::optional<decoder_type> {
        std::shared_lock lock(_mutex);
        auto it = _decoders.find(command_type);
        if (it == _decoders.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] auto contains(std::string_view command_type) const -> bool {
        std::shared_lock lock(_mutex);
        return _decoders.find(command_type) != _decoders.end();
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::shared_lock lock(_mutex);
        return _decoders.size();
    }

    // Registered tags in ascending order
    [[nodiscard]] auto registered_types() const -> std::vector<std::string> {
        std::shared_lock lock(_mutex);
        std::vector<std::string> types;
        types.reserve(_decoders.size());
        for (const auto& [command_type, decoder] : _decoders) {
            types.push_back(command_type);
        }
        return types;
    }

private:
    std::map<std::string, decoder_type, std::less<>> _decoders;
    mutable std::shared_mutex _mutex;
    Logger _logger;
};

} // namespace raftlog
