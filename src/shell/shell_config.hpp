#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace vault {

/*
 * Command-line settings of vault_shell.
 */
// Largest accepted --capacity, in buckets
inline constexpr size_t MAX_SHELL_CAPACITY = size_t{1} << 24;

struct ShellConfig {
    size_t capacity{0};                 // initial bucket reservation
    bool quiet{false};                  // no prompt, no banner
    std::optional<std::string> script;  // read commands from this file instead of stdin
    bool show_help{false};
};

// Throws std::invalid_argument on an unknown flag or a bad value
ShellConfig parse_shell_args(int argc, const char* const argv[]);

std::string shell_usage(const std::string& program);

} // namespace vault
