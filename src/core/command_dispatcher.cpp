
#include "vault/command_dispatcher.hpp"

namespace vault {

std::string CommandDispatcher::execute(const Command& command, StringVault& vault) {
    return std::visit([&](const auto& cmd) -> std::string {
        using T = std::decay_t<decltype(cmd)>;

        if constexpr (std::is_same_v<T, Add>) {
            VaultKey key = vault.add(cmd.value);
            return Protocol::format_value(key.to_string());

        } else if constexpr (std::is_same_v<T, AddWithKey>) {
            return vault.add_with_key(cmd.value, cmd.key) ?
                Protocol::format_ok() :
                Protocol::format_error("key already present");

        } else if constexpr (std::is_same_v<T, Remove>) {
            auto value = vault.remove(cmd.key);
            return value ?
                Protocol::format_value(*value) :
                Protocol::format_error("key not found");

        } else if constexpr (std::is_same_v<T, Has>) {
            return Protocol::format_integer(vault.has_item(cmd.key) ? 1 : 0);

        } else if constexpr (std::is_same_v<T, Replace>) {
            bool updated = vault.update_item(cmd.key, [&](std::string&&) {
                return cmd.value;
            });
            return updated ?
                Protocol::format_ok() :
                Protocol::format_error("key not found");

        } else if constexpr (std::is_same_v<T, Append>) {
            bool updated = vault.update_item(cmd.key, [&](std::string& value) {
                value += cmd.suffix;
            });
            return updated ?
                Protocol::format_ok() :
                Protocol::format_error("key not found");

        } else if constexpr (std::is_same_v<T, Clear>) {
            vault.clear();
            return Protocol::format_ok();

        } else if constexpr (std::is_same_v<T, Size>) {
            return Protocol::format_integer(vault.size());

        } else if constexpr (std::is_same_v<T, NewKey>) {
            return Protocol::format_value(VaultKey::generate().to_string());

        } else if constexpr (std::is_same_v<T, Ping>) {
            return Protocol::format_value("PONG");

        } else if constexpr (std::is_same_v<T, NoOp>) {
            return std::string{};
        }
    }, command);
}

} // namespace vault
