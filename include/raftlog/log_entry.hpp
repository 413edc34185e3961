#pragma once

#include <raftlog/command.hpp>
#include <raftlog/custom_command.hpp>
#include <raftlog/logger.hpp>
#include <raftlog/types.hpp>

#include <boost/json.hpp>

#include <cstdint>
#include <exception>
#include <optional>
#include <ostream>
#include <utility>

namespace raftlog {

// One replicated log slot. An entry without a command is a no-op slot.
template<typename Custom, typename NodeId = std::uint64_t, typename TermId = std::uint64_t>
requires custom_command<Custom> && node_id<NodeId> && term_id<TermId>
struct log_entry {
    using command_value_type = raftlog::command<Custom, NodeId>;
    using term_type = TermId;

    TermId _term{0};
    std::optional<command_value_type> _command;

    auto term() const -> TermId { return _term; }
    auto command() const -> const std::optional<command_value_type>& { return _command; }
    auto has_command() const -> bool { return _command.has_value(); }

    // {"term": n} plus the flattened "type" and "command" members when a command is present
    auto to_json() const -> boost::json::value {
        boost::json::object obj;
        if (_command.has_value()) {
            obj[fields::command] = _command->to_json();
        }
        obj[fields::term] = static_cast<std::uint64_t>(_term);
        if (_command.has_value()) {
            obj[fields::type] = boost::json::string(_command->command_type());
        }
        return obj;
    }

    // Never fails: a bad term reads as 0 and an undecodable command as no command.
    template<typename Registry>
    requires command_decoder_registry<Registry, Custom>
    static auto from_json(const boost::json::value& value, const Registry& registry) -> log_entry {
        return decode(value, registry, [](const std::exception&) {});
    }

    // Same as above, reporting each dropped command to the logger
    template<typename Registry, typename Logger>
    requires command_decoder_registry<Registry, Custom> && diagnostic_logger<Logger>
    static auto from_json(
        const boost::json::value& value,
        const Registry& registry,
        Logger& logger,
        log_level level = log_level::warning
    ) -> log_entry {
        return decode(value, registry, [&](const std::exception& e) {
            logger.log(level, "Dropped undecodable command from log entry", {
                {"reason", e.what()}
            });
        });
    }

    auto operator==(const log_entry&) const -> bool = default;

    friend auto operator<<(std::ostream& os, const log_entry& entry) -> std::ostream& {
        os << "log_entry{term=" << static_cast<std::uint64_t>(entry._term) << ", command=";
        if (entry._command.has_value()) {
            os << *entry._command;
        } else {
            os << "none";
        }
        return os << '}';
    }

private:
    template<typename Registry, typename OnDropped>
    static auto decode(const boost::json::value& value, const Registry& registry, OnDropped&& on_dropped) -> log_entry {
        log_entry entry;

        if (const auto* term = detail::find_member(value, fields::term)) {
            entry._term = detail::as_unsigned<TermId>(*term).value_or(TermId{0});
        }

        // No discriminator at all is an ordinary no-op slot, not a dropped command
        if (detail::find_member(value, fields::type) == nullptr) {
            return entry;
        }

        try {
            entry._command = command_value_type::from_json(value, registry);
        } catch (const std::exception& e) {
            std::forward<OnDropped>(on_dropped)(e);
        }
        return entry;
    }
};

} // namespace raftlog
