#include "vault/protocol.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace vault {

namespace {

void expect_args(const std::vector<std::string_view>& tokens, size_t count, const char* message) {
    if (tokens.size() != count + 1)
        throw ProtocolError{message};
}

} // anonymous namespace


Command Protocol::parse(std::string_view line) {
    // CRLF tolerance (windows scripts, pasted input)
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    std::vector<std::string_view> tokens;
    tokens.reserve(3);

    size_t pos = 0;

    while (pos < line.size()) {
        // Skip spaces
        while (pos < line.size() && line[pos] == ' ')
            ++pos;

        if (pos >= line.size())
            break;

        size_t start = pos;
        while (pos < line.size() && line[pos] != ' ')
            ++pos;

        tokens.emplace_back(line.substr(start, pos - start));
    }

    if (tokens.empty()) {
        return NoOp{ };
    }

    return parse_tokens(tokens);
}

Command Protocol::parse_tokens(const std::vector<std::string_view>& tokens) {
    std::string cmd{tokens[0]};
    std::transform(cmd.begin(), cmd.end(), cmd.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    if (cmd == "add") {
        expect_args(tokens, 1, "ADD requires exactly one argument");
        return Add{ std::string{tokens[1]} };
    }

    if (cmd == "put") {
        expect_args(tokens, 2, "PUT requires exactly two arguments");
        return AddWithKey{ parse_key(tokens[1]), std::string{tokens[2]} };
    }

    if (cmd == "take") {
        expect_args(tokens, 1, "TAKE requires exactly one argument");
        return Remove{ parse_key(tokens[1]) };
    }

    if (cmd == "has") {
        expect_args(tokens, 1, "HAS requires exactly one argument");
        return Has{ parse_key(tokens[1]) };
    }

    if (cmd == "set") {
        expect_args(tokens, 2, "SET requires exactly two arguments");
        return Replace{ parse_key(tokens[1]), std::string{tokens[2]} };
    }

    if (cmd == "append") {
        expect_args(tokens, 2, "APPEND requires exactly two arguments");
        return Append{ parse_key(tokens[1]), std::string{tokens[2]} };
    }

    if (cmd == "clear") {
        expect_args(tokens, 0, "CLEAR takes no arguments");
        return Clear{ };
    }

    if (cmd == "size") {
        expect_args(tokens, 0, "SIZE takes no arguments");
        return Size{ };
    }

    if (cmd == "newkey") {
        expect_args(tokens, 0, "NEWKEY takes no arguments");
        return NewKey{ };
    }

    if (cmd == "ping") {
        expect_args(tokens, 0, "PING takes no arguments");
        return Ping{ };
    }

    throw ProtocolError{"unknown command"};
}

VaultKey Protocol::parse_key(std::string_view token) {
    if (token == "zero")
        return VaultKey::zero();

    try {
        return VaultKey::parse(token);
    } catch (const KeyFormatError& e) {
        throw ProtocolError{std::string{"invalid key: "} + e.what()};
    }
}

std::string Protocol::format_ok() {
    return "+OK\n";
}

std::string Protocol::format_error(std::string_view message) {
    return "-ERR " + std::string{message} + "\n";
}

std::string Protocol::format_value(std::string_view value) {
    return "$" + std::string{value} + "\n";
}

std::string Protocol::format_integer(size_t value) {
    return ":" + std::to_string(value) + "\n";
}

} // namespace vault
