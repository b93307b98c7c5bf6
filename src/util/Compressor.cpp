#include "util/Compressor.hpp"

#include <zlib.h>
#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace sp::util {

static constexpr int GZIP_WINDOW_BITS = 15 + 16; // max window, gzip wrapper
static constexpr int MEM_LEVEL = 8;
static constexpr size_t CHUNK = 16 * 1024;

GzipCompressor::GzipCompressor(const int level) : level_(level) {
    if (level_ < Z_DEFAULT_COMPRESSION || level_ > Z_BEST_COMPRESSION)
        throw std::invalid_argument("zlib compression level out of range: " + std::to_string(level_));
}

std::vector<uint8_t> GzipCompressor::compress(const std::span<const uint8_t> data) const {
    if (data.size() > std::numeric_limits<uInt>::max())
        throw std::runtime_error("Buffer too large to compress in one pass");

    z_stream zs{};
    if (deflateInit2(&zs, level_, Z_DEFLATED, GZIP_WINDOW_BITS, MEM_LEVEL, Z_DEFAULT_STRATEGY) != Z_OK)
        throw std::runtime_error("deflateInit2 failed");

    std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(data.size())));

    zs.next_in = const_cast<Bytef*>(data.data());
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    const int rc = deflate(&zs, Z_FINISH);
    const auto produced = zs.total_out;
    deflateEnd(&zs);

    if (rc != Z_STREAM_END) throw std::runtime_error("deflate failed with code " + std::to_string(rc));

    out.resize(produced);
    return out;
}

std::optional<std::vector<uint8_t>> GzipCompressor::decompress(const std::span<const uint8_t> data) const {
    if (data.empty() || data.size() > std::numeric_limits<uInt>::max()) return std::nullopt;

    z_stream zs{};
    if (inflateInit2(&zs, GZIP_WINDOW_BITS) != Z_OK) return std::nullopt;

    zs.next_in = const_cast<Bytef*>(data.data());
    zs.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> out;
    std::array<uint8_t, CHUNK> buf{};
    int rc = Z_OK;

    while (rc == Z_OK) {
        zs.next_out = buf.data();
        zs.avail_out = static_cast<uInt>(buf.size());
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) break;
        out.insert(out.end(), buf.data(), buf.data() + (buf.size() - zs.avail_out));
        // input exhausted without reaching the end of the stream
        if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            rc = Z_DATA_ERROR;
            break;
        }
    }

    inflateEnd(&zs);
    if (rc != Z_STREAM_END) return std::nullopt;
    return out;
}

}
