#include "vault/vault_key.hpp"

#include <cstring>
#include <random>

namespace vault {

namespace {

// One generator per thread, no locking on the hot path
thread_local std::random_device rd;
thread_local std::mt19937_64 gen(rd());

constexpr size_t TEXT_SIZE = 36;
constexpr char HEX_DIGITS[] = "0123456789abcdef";

bool is_dash_position(size_t pos) {
    return pos == 8 || pos == 13 || pos == 18 || pos == 23;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // anonymous namespace


VaultKey VaultKey::generate() {
    Bytes bytes;
    std::uint64_t hi = gen();
    std::uint64_t lo = gen();
    std::memcpy(bytes.data(), &hi, sizeof(hi));
    std::memcpy(bytes.data() + sizeof(hi), &lo, sizeof(lo));

    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80); // variant 10
    return VaultKey{bytes};
}

VaultKey VaultKey::parse(std::string_view text) {
    if (text.size() != TEXT_SIZE)
        throw KeyFormatError{"key must be 36 characters"};

    Bytes bytes{};
    size_t byte_idx = 0;
    for (size_t pos = 0; pos < TEXT_SIZE;) {
        if (is_dash_position(pos)) {
            if (text[pos] != '-')
                throw KeyFormatError{"key has a misplaced separator"};
            ++pos;
            continue;
        }
        int high = hex_value(text[pos]);
        int low = hex_value(text[pos + 1]);
        if (high < 0 || low < 0)
            throw KeyFormatError{"key contains a non-hex character"};

        bytes[byte_idx++] = static_cast<std::uint8_t>((high << 4) | low);
        pos += 2;
    }
    return VaultKey{bytes};
}

bool VaultKey::is_zero() const noexcept {
    return *this == zero();
}

std::string VaultKey::to_string() const {
    std::string out;
    out.reserve(TEXT_SIZE);
    for (size_t i = 0; i < SIZE; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out.push_back('-');
        out.push_back(HEX_DIGITS[bytes_[i] >> 4]);
        out.push_back(HEX_DIGITS[bytes_[i] & 0x0F]);
    }
    return out;
}

size_t VaultKey::hash() const noexcept {
    // The bytes are already uniformly random, folding the halves is enough
    std::uint64_t hi;
    std::uint64_t lo;
    std::memcpy(&hi, bytes_.data(), sizeof(hi));
    std::memcpy(&lo, bytes_.data() + sizeof(hi), sizeof(lo));
    return static_cast<size_t>(hi ^ (lo * 0x9E3779B97F4A7C15ULL));
}

std::ostream& operator<<(std::ostream& os, const VaultKey& key) {
    return os << key.to_string();
}

} // namespace vault
