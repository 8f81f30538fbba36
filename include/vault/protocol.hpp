#pragma once

#include "vault/vault_key.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <stdexcept>

namespace vault {

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

struct Add {
    std::string value;
};

struct AddWithKey {
    VaultKey key;
    std::string value;
};

struct Remove {
    VaultKey key;
};

struct Has {
    VaultKey key;
};

// Replace the stored value wholesale
struct Replace {
    VaultKey key;
    std::string value;
};

// Append to the stored value in place
struct Append {
    VaultKey key;
    std::string suffix;
};

struct Clear {};
struct Size {};
struct NewKey {};
struct Ping {};
struct NoOp {};

using Command = std::variant<Add, AddWithKey, Remove, Has, Replace, Append,
                             Clear, Size, NewKey, Ping, NoOp>;

/*
 * Line protocol of the vault shell.
 * Parses commands like ADD, PUT, TAKE, HAS and formats replies.
 */
class Protocol {
public:
    static Command parse(std::string_view line);

    static std::string format_ok();
    static std::string format_error(std::string_view message);
    static std::string format_value(std::string_view value);
    static std::string format_integer(size_t value);

private:
    static Command parse_tokens(const std::vector<std::string_view>& tokens);
    static VaultKey parse_key(std::string_view token);
};

} // namespace vault
