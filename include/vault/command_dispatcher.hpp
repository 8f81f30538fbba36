#pragma once

#include "vault/vault.hpp"
#include "vault/protocol.hpp"

#include <string>

namespace vault {

using StringVault = Vault<std::string>;

class CommandDispatcher {
public:
    // Run command against vault and return the formatted reply.
    // NoOp yields an empty string.
    static std::string execute(const Command& command, StringVault& vault);
};

} // namespace vault
