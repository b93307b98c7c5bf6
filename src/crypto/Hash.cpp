#include "crypto/Hash.hpp"
#include "util/hex.hpp"

#include <openssl/sha.h>
#include <stdexcept>
#include <vector>

namespace sp::crypto {

void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

std::string sha256Hex(const std::span<const uint8_t> data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);
    return util::toHex(std::span<const uint8_t>(hash, SHA256_DIGEST_LENGTH));
}

std::string sha256Hex(const std::string_view data) {
    return sha256Hex(std::span(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

Blake2b::Blake2b(const size_t outBytes) : outBytes_(outBytes) {
    ensure_sodium_init();
    if (outBytes_ < crypto_generichash_BYTES_MIN || outBytes_ > crypto_generichash_BYTES_MAX)
        throw std::invalid_argument("Blake2b digest length out of range");
    crypto_generichash_init(&state_, nullptr, 0, outBytes_);
}

Blake2b& Blake2b::update(const std::string_view data) {
    if (finalized_) throw std::logic_error("Blake2b already finalized");
    crypto_generichash_update(&state_,
                              reinterpret_cast<const unsigned char*>(data.data()), data.size());
    return *this;
}

std::string Blake2b::hexDigest() {
    if (finalized_) throw std::logic_error("Blake2b already finalized");
    std::vector<uint8_t> out(outBytes_);
    crypto_generichash_final(&state_, out.data(), out.size());
    finalized_ = true;
    return util::toHex(out);
}

}
