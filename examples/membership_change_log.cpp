/**
 * Example: Membership Changes in the Replicated Log
 *
 * This example demonstrates:
 * 1. Recording a joint consensus membership change as log entries
 * 2. Shipping a batch of entries as JSON and decoding it on a follower
 * 3. Applying committed key-value commands next to membership commands
 * 4. Tolerating entries whose command the follower does not understand
 */

#include <raftlog/command.hpp>
#include <raftlog/command_registry.hpp>
#include <raftlog/console_logger.hpp>
#include <raftlog/examples/key_value_command.hpp>
#include <raftlog/json_serializer.hpp>
#include <raftlog/log_entry.hpp>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {
    constexpr std::uint64_t bootstrap_term = 1;
    constexpr std::uint64_t change_term = 2;

    using kv_command = raftlog::examples::key_value_command;
    using kv_registry = raftlog::command_registry<kv_command>;
    using kv_log_command = raftlog::command<kv_command>;
    using kv_entry = raftlog::log_entry<kv_command>;
    using kv_serializer = raftlog::json_log_entry_serializer<kv_command, kv_registry>;

    // Bootstrap a three node cluster, write some keys, then swap node 1 for node 4
    auto build_leader_log() -> std::vector<kv_entry> {
        const raftlog::node_set<> initial{1, 2, 3};
        const raftlog::node_set<> target{2, 3, 4};

        return {
            kv_entry{bootstrap_term, kv_log_command::single({}, initial)},
            kv_entry{bootstrap_term, kv_log_command{kv_command::put("leader", "1")}},
            kv_entry{bootstrap_term, kv_log_command{kv_command::put("color", "blue")}},
            kv_entry{change_term, std::nullopt},
            kv_entry{change_term, kv_log_command::joint(initial, target)},
            kv_entry{change_term, kv_log_command{kv_command::erase("leader")}},
            kv_entry{change_term, kv_log_command::single(initial, target)},
        };
    }

    auto bytes_to_string(const std::vector<std::byte>& bytes) -> std::string {
        std::string str;
        str.reserve(bytes.size());
        for (auto byte : bytes) {
            str += static_cast<char>(byte);
        }
        return str;
    }

    auto string_to_bytes(const std::string& str) -> std::vector<std::byte> {
        std::vector<std::byte> bytes;
        bytes.reserve(str.size());
        for (char c : str) {
            bytes.push_back(static_cast<std::byte>(c));
        }
        return bytes;
    }
}

auto test_replicate_membership_change() -> bool {
    std::cout << "Test 1: Replicate a joint consensus membership change\n";

    try {
        kv_registry registry(raftlog::console_logger{raftlog::log_level::info});
        raftlog::examples::register_key_value_commands(registry);
        kv_serializer serializer(registry, raftlog::console_logger{raftlog::log_level::info});

        auto leader_log = build_leader_log();
        auto wire = serializer.serialize(leader_log);
        std::cout << "  Batch of " << leader_log.size() << " entries, " << wire.size() << " bytes\n";

        auto follower_log = serializer.deserialize_log_entries(wire);
        if (follower_log != leader_log) {
            std::cerr << "  ✗ Failed: follower log differs from leader log\n";
            return false;
        }

        for (std::size_t i = 0; i < follower_log.size(); ++i) {
            const auto& entry = follower_log[i];
            std::cout << "  [" << i + 1 << "] " << entry;
            if (entry.has_command() && entry.command()->is_configuration_change()) {
                std::cout << "  <- configuration change";
            }
            std::cout << "\n";
        }

        std::cout << "  ✓ Scenario passed\n";
        return true;

    } catch (const std::exception& e) {
        std::cerr << "  ✗ Scenario failed: " << e.what() << "\n";
        return false;
    }
}

auto test_apply_committed_entries() -> bool {
    std::cout << "\nTest 2: Apply committed key-value commands\n";

    try {
        raftlog::examples::key_value_store store;
        for (const auto& entry : build_leader_log()) {
            if (entry.has_command()) {
                store.apply(*entry.command());
            }
        }

        std::cout << "  Keys in store: " << store.size() << "\n";
        std::cout << "  color = " << store.get("color").value_or("<missing>") << "\n";
        std::cout << "  leader = " << store.get("leader").value_or("<missing>") << "\n";

        if (store.size() != 1 || store.get("color") != "blue" || store.get("leader").has_value()) {
            std::cerr << "  ✗ Failed: unexpected store contents\n";
            return false;
        }

        std::cout << "  ✓ Scenario passed\n";
        return true;

    } catch (const std::exception& e) {
        std::cerr << "  ✗ Scenario failed: " << e.what() << "\n";
        return false;
    }
}

auto test_unknown_command_from_newer_leader() -> bool {
    std::cout << "\nTest 3: Entry written by a newer application version\n";

    try {
        kv_registry registry(raftlog::console_logger{raftlog::log_level::info});
        raftlog::examples::register_key_value_commands(registry);
        kv_serializer serializer(registry, raftlog::console_logger{raftlog::log_level::info});

        auto entry = serializer.deserialize_log_entry(string_to_bytes(
            R"({"command":{"key":"color"},"term":3,"type":"KeyValueCompareAndSwap"})"));

        std::cout << "  Decoded " << entry << "\n";
        std::cout << "  Re-encoded " << bytes_to_string(serializer.serialize(entry)) << "\n";

        if (entry.term() != 3 || entry.has_command()) {
            std::cerr << "  ✗ Failed: unknown command was not dropped\n";
            return false;
        }

        std::cout << "  ✓ Scenario passed\n";
        return true;

    } catch (const std::exception& e) {
        std::cerr << "  ✗ Scenario failed: " << e.what() << "\n";
        return false;
    }
}

auto main() -> int {
    std::cout << "========================================\n";
    std::cout << "  Membership Change Log Example\n";
    std::cout << "========================================\n\n";

    int failed_scenarios = 0;

    if (!test_replicate_membership_change()) failed_scenarios++;
    if (!test_apply_committed_entries()) failed_scenarios++;
    if (!test_unknown_command_from_newer_leader()) failed_scenarios++;

    std::cout << "\n========================================\n";
    if (failed_scenarios > 0) {
        std::cout << "  " << failed_scenarios << " scenario(s) failed\n";
        std::cout << "========================================\n";
        return 1;
    }

    std::cout << "  All scenarios passed!\n";
    std::cout << "========================================\n";
    return 0;
}
