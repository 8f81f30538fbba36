#pragma once

#include "vault/command_dispatcher.hpp"

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace vault {

struct SessionStats {
    size_t executed{0}; // commands dispatched, PING and NEWKEY included
    size_t rejected{0}; // lines answered with a protocol error
};

/*
 * One shell session over a pair of streams.
 *
 * Reads a command per line, runs it against the vault and writes the reply.
 * Protocol errors are answered and the session carries on.
 * LockError / PoisonedError from the vault propagate out of run().
 */
class Session {
public:
    Session(std::istream& in, std::ostream& out, StringVault& vault, bool echo_prompt = false)
        : in_(in), out_(out), vault_(vault), echo_prompt_(echo_prompt) {};

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Process lines until end of input
    SessionStats run();

    // Reply for a single line, empty for blank lines
    std::string handle_line(std::string_view line);

    const SessionStats& stats() const noexcept { return stats_; }

    // Longest accepted line, excluding the newline
    static constexpr size_t MAX_LINE_SIZE = 1024 * 1024 * 2; // 2MB limit

private:
    enum class ReadStatus { Line, TooLong, End };

    // Reads up to the next newline, buffering at most MAX_LINE_SIZE bytes.
    // Longer lines are consumed and reported as TooLong.
    ReadStatus read_line(std::string& line);

    static constexpr std::string_view PROMPT = "vault> ";

    std::istream& in_;
    std::ostream& out_;
    StringVault& vault_;
    bool echo_prompt_;
    SessionStats stats_;
};

} // namespace vault
