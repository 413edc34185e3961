#pragma once

#include <stdexcept>
#include <string>

namespace raftlog {

// Base exception for all log entry format errors
class raftlog_exception : public std::runtime_error {
public:
    explicit raftlog_exception(const std::string& message)
        : std::runtime_error(message) {}
};

// Exception for encoding and decoding errors
class serialization_exception : public raftlog_exception {
public:
    explicit serialization_exception(const std::string& message)
        : raftlog_exception(message) {}
};

// Base exception for a command body that cannot be decoded
class command_decode_error : public serialization_exception {
public:
    explicit command_decode_error(const std::string& message)
        : serialization_exception(message) {}
};

// The value carries no string "type" discriminator
class missing_type_error : public command_decode_error {
public:
    missing_type_error()
        : command_decode_error("Command has no \"type\" discriminator") {}
};

// The discriminator is neither built in nor registered
class unknown_command_type_error : public command_decode_error {
public:
    explicit unknown_command_type_error(const std::string& command_type)
        : command_decode_error("Unknown command type \"" + command_type + "\"")
        , _command_type(command_type) {}

    auto command_type() const -> const std::string& {
        return _command_type;
    }

private:
    std::string _command_type;
};

// A built-in command whose envelope is structurally unusable
class malformed_command_error : public command_decode_error {
public:
    explicit malformed_command_error(const std::string& message)
        : command_decode_error(message) {}
};

// Exception for invalid decoder registrations
class registry_exception : public raftlog_exception {
public:
    explicit registry_exception(const std::string& message)
        : raftlog_exception(message) {}
};

// Exception for invalid serializer configuration
class configuration_exception : public raftlog_exception {
public:
    explicit configuration_exception(const std::string& message)
        : raftlog_exception(message) {}
};

} // namespace raftlog
