#include "shell_config.hpp"

#include <stdexcept>
#include <string_view>

namespace vault {

namespace {

size_t parse_capacity(std::string_view text) {
    if (text.empty() || text.front() == '-')
        throw std::invalid_argument{"--capacity expects a non-negative integer"};

    size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(std::string{text}, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument{"--capacity expects a non-negative integer"};
    }
    if (consumed != text.size())
        throw std::invalid_argument{"--capacity expects a non-negative integer"};
    if (value > MAX_SHELL_CAPACITY)
        throw std::invalid_argument{"--capacity must not exceed " + std::to_string(MAX_SHELL_CAPACITY)};
    return static_cast<size_t>(value);
}

} // anonymous namespace


ShellConfig parse_shell_args(int argc, const char* const argv[]) {
    ShellConfig config;

    for (int i = 1; i < argc; i++) {
        std::string_view arg{argv[i]};

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--quiet" || arg == "-q") {
            config.quiet = true;
        } else if (arg == "--capacity") {
            if (i + 1 >= argc)
                throw std::invalid_argument{"--capacity requires a value"};
            config.capacity = parse_capacity(argv[++i]);
        } else if (arg == "--script") {
            if (i + 1 >= argc)
                throw std::invalid_argument{"--script requires a file name"};
            config.script = std::string{argv[++i]};
        } else {
            throw std::invalid_argument{"unknown option: " + std::string{arg}};
        }
    }
    return config;
}

std::string shell_usage(const std::string& program) {
    return "usage: " + program + " [--capacity N] [--quiet] [--script FILE]\n"
           "  --capacity N   reserve N buckets up front\n"
           "  --quiet        no prompt and no banner\n"
           "  --script FILE  read commands from FILE instead of stdin\n"
           "  --help         show this message\n";
}

} // namespace vault
