#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace sp::util {

// gzip framed DEFLATE streams (RFC 1952) on top of zlib
struct GzipCompressor {
    explicit GzipCompressor(int level = -1);

    [[nodiscard]] std::vector<uint8_t> compress(std::span<const uint8_t> data) const;

    // nullopt when the input is not a complete, well-formed gzip stream
    [[nodiscard]] std::optional<std::vector<uint8_t>> decompress(std::span<const uint8_t> data) const;

    [[nodiscard]] int level() const { return level_; }

private:
    int level_;
};

}
