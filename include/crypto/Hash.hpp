#pragma once

#include <cstddef>
#include <cstdint>
#include <sodium.h>
#include <span>
#include <string>
#include <string_view>

namespace sp::crypto {

void ensure_sodium_init();

// SHA-256 of a buffer as lowercase hex; used for every content hash
std::string sha256Hex(std::span<const uint8_t> data);
std::string sha256Hex(std::string_view data);

// Incremental BLAKE2b over several fields, hex encoded.
class Blake2b {
public:
    explicit Blake2b(size_t outBytes = 32);

    Blake2b& update(std::string_view data);
    [[nodiscard]] std::string hexDigest();

private:
    crypto_generichash_state state_{};
    size_t outBytes_;
    bool finalized_ = false;
};

}
