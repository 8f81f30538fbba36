
#include "session.hpp"
#include "shell_config.hpp"

#include <fstream>
#include <iostream>
#include <new>
#include <stdexcept>


/*
 * Entry point for the vault shell.
 * parse CLI args
 * run a session over stdin or a script
 * exit when input ends
 */

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "vault_shell";

    vault::ShellConfig config;
    try {
        config = vault::parse_shell_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n" << vault::shell_usage(program);
        return 2;
    }

    if (config.show_help) {
        std::cout << vault::shell_usage(program);
        return 0;
    }

    std::ifstream script;
    if (config.script) {
        script.open(*config.script);
        if (!script) {
            std::cerr << "[Shell] cannot open script: " << *config.script << "\n";
            return 1;
        }
    }
    std::istream& input = config.script ? static_cast<std::istream&>(script) : std::cin;

    bool interactive = !config.quiet && !config.script;

    try {
        vault::StringVault store{config.capacity};
        if (interactive)
            std::cout << "[Shell] vault ready, type PING to check, Ctrl-D to quit\n";

        vault::Session session{input, std::cout, store, interactive};
        vault::SessionStats stats = session.run();
        if (!config.quiet)
            std::cout << "[Shell] " << stats.executed << " commands executed, "
                      << stats.rejected << " rejected\n";
    } catch (const vault::LockError& e) {
        std::cerr << "[Shell] fatal vault error: " << e.what() << "\n";
        return 1;
    } catch (const std::bad_alloc& e) {
        std::cerr << "[Shell] out of memory: " << e.what() << "\n";
        return 1;
    } catch (const std::length_error& e) {
        std::cerr << "[Shell] vault too large: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
