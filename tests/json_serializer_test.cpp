#define BOOST_TEST_MODULE JsonSerializerTest
#include <boost/test/unit_test.hpp>

#include "test_commands.hpp"

#include <raftlog/exceptions.hpp>
#include <raftlog/json_serializer.hpp>
#include <raftlog/serializer_config.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace test_commands;

namespace {
    using serializer_type = raftlog::json_log_entry_serializer<payload_command, payload_registry>;

    const raftlog::node_set<> old_members{5, 42, 85, 13531, 8354};
    const raftlog::node_set<> new_members{42, 85, 13531, 8354};

    auto string_to_bytes(const std::string& str) -> std::vector<std::byte> {
        std::vector<std::byte> result;
        result.reserve(str.size());
        for (char c : str) {
            result.push_back(static_cast<std::byte>(c));
        }
        return result;
    }

    auto bytes_to_string(const std::vector<std::byte>& data) -> std::string {
        std::string result;
        result.reserve(data.size());
        for (auto b : data) {
            result.push_back(static_cast<char>(b));
        }
        return result;
    }

    auto quiet_logger() -> raftlog::console_logger {
        return raftlog::console_logger(raftlog::log_level::critical);
    }
}

BOOST_AUTO_TEST_SUITE(json_serializer_encode_test)

BOOST_AUTO_TEST_CASE(test_serialize_entry_is_canonical_text) {
    payload_registry registry;
    serializer_type serializer(registry, quiet_logger());

    payload_entry entry{9, payload_cmd::single(old_members, new_members)};

    BOOST_CHECK_EQUAL(
        bytes_to_string(serializer.serialize(entry)),
        R"({"command":{"configuration":{"instanceIds":[42,85,8354,13531]},)"
        R"("oldConfiguration":{"instanceIds":[5,42,85,8354,13531]}},"term":9,"type":"SingleConfiguration"})"
    );
}

BOOST_AUTO_TEST_CASE(test_identical_entries_give_identical_bytes) {
    payload_registry registry;
    serializer_type serializer(registry, quiet_logger());

    raftlog::node_set<> forward;
    raftlog::node_set<> backward;
    const std::vector<std::uint64_t> ids = {7, 3, 1000, 12, 99, 4};
    for (auto it = ids.begin(); it != ids.end(); ++it) {
        forward.insert(*it);
    }
    for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
        backward.insert(*it);
    }

    payload_entry first{3, payload_cmd::joint(forward, backward)};
    payload_entry second{3, payload_cmd::joint(backward, forward)};

    BOOST_CHECK(serializer.serialize(first) == serializer.serialize(second));
}

BOOST_AUTO_TEST_CASE(test_serialize_command_envelope) {
    payload_registry registry;
    serializer_type serializer(registry, quiet_logger());

    BOOST_CHECK_EQUAL(
        bytes_to_string(serializer.serialize(payload_cmd{payload_command{5}})),
        R"({"command":{"payload":5},"type":"Payload"})"
    );
}

BOOST_AUTO_TEST_CASE(test_serialize_batch) {
    payload_registry registry;
    serializer_type serializer(registry, quiet_logger());

    std::vector<payload_entry> entries = {
        payload_entry{1, std::nullopt},
        payload_entry{2, payload_cmd{payload_command{5}}},
    };

    BOOST_CHECK_EQUAL(
        bytes_to_string(serializer.serialize(entries)),
        R"([{"term":1},{"command":{"payload":5},"term":2,"type":"Payload"}])"
    );
}

BOOST_AUTO_TEST_CASE(test_serialize_batch_over_limit_is_rejected) {
    payload_registry registry;
    raftlog::json_serializer_config config;
    config.max_batch_entries = 2;
    serializer_type serializer(registry, quiet_logger(), config);

    std::vector<payload_entry> entries(3, payload_entry{1, std::nullopt});

    BOOST_CHECK_THROW(serializer.serialize(entries), raftlog::serialization_exception);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(json_serializer_decode_test)

BOOST_AUTO_TEST_CASE(test_entry_round_trip) {
    payload_registry registry;
    make_payload_registry(registry);
    serializer_type serializer(registry, quiet_logger());

    const std::vector<payload_entry> entries = {
        payload_entry{0, std::nullopt},
        payload_entry{9, payload_cmd::single(old_members, new_members)},
        payload_entry{10, payload_cmd::joint(old_members, new_members)},
        payload_entry{11, payload_cmd::joint({}, {})},
        payload_entry{12, payload_cmd{payload_command{77}}},
    };

    for (const auto& entry : entries) {
        BOOST_CHECK_EQUAL(serializer.deserialize_log_entry(serializer.serialize(entry)), entry);
    }
}

BOOST_AUTO_TEST_CASE(test_batch_round_trip) {
    payload_registry registry;
    make_payload_registry(registry);
    serializer_type serializer(registry, quiet_logger());

    const std::vector<payload_entry> entries = {
        payload_entry{1, payload_cmd::single({1, 2, 3}, {1, 2, 3, 4})},
        payload_entry{1, payload_cmd{payload_command{8}}},
        payload_entry{2, std::nullopt},
    };

    BOOST_CHECK(serializer.deserialize_log_entries(serializer.serialize(entries)) == entries);
}

BOOST_AUTO_TEST_CASE(test_unreadable_bytes_are_rejected) {
    payload_registry registry;
    captured_logger capture;
    serializer_type serializer(registry, capture.make());

    BOOST_CHECK_THROW(serializer.deserialize_log_entry(string_to_bytes("{\"term\": 9")),
                      raftlog::serialization_exception);
    BOOST_CHECK_THROW(serializer.deserialize_log_entry(string_to_bytes("")),
                      raftlog::serialization_exception);
    BOOST_CHECK_THROW(serializer.deserialize_command(string_to_bytes("not json")),
                      raftlog::serialization_exception);

    BOOST_CHECK(capture.out.str().find("Rejected malformed payload") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_oversized_payload_is_rejected) {
    payload_registry registry;
    raftlog::json_serializer_config config;
    config.max_message_size = 16;
    serializer_type serializer(registry, quiet_logger(), config);

    BOOST_CHECK_NO_THROW(serializer.deserialize_log_entry(string_to_bytes(R"({"term":9})")));
    BOOST_CHECK_THROW(serializer.deserialize_log_entry(string_to_bytes(R"({"term":9,"padding":"xxxxxxxx"})")),
                      raftlog::serialization_exception);
}

BOOST_AUTO_TEST_CASE(test_undecodable_command_is_dropped_and_logged) {
    payload_registry registry;
    captured_logger capture;
    raftlog::json_serializer_config config;
    config.dropped_command_log_level = raftlog::log_level::info;
    serializer_type serializer(registry, capture.make(), config);

    auto entry = serializer.deserialize_log_entry(
        string_to_bytes(R"({"type":"Payload","term":4,"command":{"payload":1}})"));

    BOOST_CHECK_EQUAL(entry, (payload_entry{4, std::nullopt}));
    BOOST_CHECK(capture.out.str().find("INFO: Dropped undecodable command") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_deserialize_command_is_strict) {
    payload_registry registry;
    serializer_type serializer(registry, quiet_logger());

    BOOST_CHECK_THROW(serializer.deserialize_command(string_to_bytes(R"({"type":"DoesNotExist","command":{}})")),
                      raftlog::unknown_command_type_error);
    BOOST_CHECK_THROW(serializer.deserialize_command(string_to_bytes(R"({"command":{}})")),
                      raftlog::missing_type_error);

    auto cmd = serializer.deserialize_command(
        string_to_bytes(R"({"type":"JointConfiguration","command":{"newConfiguration":{"instanceIds":[3]}}})"));
    BOOST_CHECK(cmd == payload_cmd::joint({}, {3}));
}

BOOST_AUTO_TEST_CASE(test_batch_must_be_array_within_limit) {
    payload_registry registry;
    raftlog::json_serializer_config config;
    config.max_batch_entries = 2;
    serializer_type serializer(registry, quiet_logger(), config);

    BOOST_CHECK_THROW(serializer.deserialize_log_entries(string_to_bytes(R"({"term":1})")),
                      raftlog::serialization_exception);
    BOOST_CHECK_THROW(serializer.deserialize_log_entries(string_to_bytes(R"([{"term":1},{"term":2},{"term":3}])")),
                      raftlog::serialization_exception);

    auto entries = serializer.deserialize_log_entries(string_to_bytes(R"([{"term":1}, 17])"));
    BOOST_REQUIRE_EQUAL(entries.size(), 2u);
    BOOST_CHECK_EQUAL(entries[0], (payload_entry{1, std::nullopt}));
    BOOST_CHECK_EQUAL(entries[1], (payload_entry{0, std::nullopt}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(json_serializer_config_test)

BOOST_AUTO_TEST_CASE(test_default_config_is_valid) {
    raftlog::json_serializer_config config;
    BOOST_CHECK_NO_THROW(raftlog::validate_serializer_config(config));
    BOOST_CHECK_EQUAL(config.max_message_size, 16u * 1024u * 1024u);
    BOOST_CHECK_EQUAL(config.max_batch_entries, 10000u);
    BOOST_CHECK(config.dropped_command_log_level == raftlog::log_level::warning);
}

BOOST_AUTO_TEST_CASE(test_zero_limits_are_rejected) {
    payload_registry registry;

    raftlog::json_serializer_config zero_size;
    zero_size.max_message_size = 0;
    BOOST_CHECK_THROW(raftlog::validate_serializer_config(zero_size), raftlog::configuration_exception);
    BOOST_CHECK_THROW(serializer_type(registry, quiet_logger(), zero_size), raftlog::configuration_exception);

    raftlog::json_serializer_config zero_batch;
    zero_batch.max_batch_entries = 0;
    BOOST_CHECK_THROW(raftlog::validate_serializer_config(zero_batch), raftlog::configuration_exception);
}

BOOST_AUTO_TEST_CASE(test_config_is_kept) {
    payload_registry registry;
    raftlog::json_serializer_config config;
    config.max_batch_entries = 5;
    serializer_type serializer(registry, quiet_logger(), config);

    BOOST_CHECK_EQUAL(serializer.config().max_batch_entries, 5u);
}

BOOST_AUTO_TEST_SUITE_END()
