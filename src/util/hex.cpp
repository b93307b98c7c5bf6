#include "util/hex.hpp"
#include "crypto/Hash.hpp"

#include <sodium.h>

namespace sp::util {

std::string toHex(const std::span<const uint8_t> bytes) {
    crypto::ensure_sodium_init();
    std::string out(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), bytes.data(), bytes.size());
    out.pop_back(); // trailing NUL written by sodium
    return out;
}

std::optional<std::vector<uint8_t>> fromHex(const std::string_view hex) {
    crypto::ensure_sodium_init();
    if (hex.size() % 2 != 0) return std::nullopt;

    std::vector<uint8_t> out(hex.size() / 2);
    size_t written = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &written, &end) != 0)
        return std::nullopt;
    if (written != out.size() || end != hex.data() + hex.size()) return std::nullopt;
    return out;
}

}
