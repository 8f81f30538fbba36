#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vault {

class KeyFormatError : public std::invalid_argument {
public:
    explicit KeyFormatError(const std::string& msg) : std::invalid_argument(msg) {}
};

/*
 * Opaque 128-bit identifier for an entry in a Vault.
 *
 * Generated keys use the RFC 4122 version 4 layout, so the version
 * nibble is always 4 and a generated key never equals zero().
 * Cheap to copy.
 */
class VaultKey {
public:
    static constexpr size_t SIZE = 16;
    using Bytes = std::array<std::uint8_t, SIZE>;

    // Fresh random key
    static VaultKey generate();

    // The all-zero sentinel
    static constexpr VaultKey zero() noexcept { return VaultKey{}; }

    // Parses "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" (either hex case).
    // Throws KeyFormatError on anything else.
    static VaultKey parse(std::string_view text);

    constexpr VaultKey() noexcept = default;
    explicit constexpr VaultKey(const Bytes& bytes) noexcept : bytes_(bytes) {}

    bool is_zero() const noexcept;
    const Bytes& bytes() const noexcept { return bytes_; }

    // Canonical lower-case form
    std::string to_string() const;

    size_t hash() const noexcept;

    friend bool operator==(const VaultKey&, const VaultKey&) = default;

private:
    Bytes bytes_{};
};

std::ostream& operator<<(std::ostream& os, const VaultKey& key);

} // namespace vault

namespace std {

template <>
struct hash<vault::VaultKey> {
    size_t operator()(const vault::VaultKey& key) const noexcept {
        return key.hash();
    }
};

} // namespace std
