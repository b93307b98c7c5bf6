#include "store/ObjectStore.hpp"
#include "storage/StorageEngine.hpp"
#include "delta/Patch.hpp"
#include "crypto/Hash.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "repo/Layout.hpp"
#include "util/Compressor.hpp"
#include "util/bytes.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>

using namespace sp::store;
using namespace sp::delta::model;
using namespace sp::error;
using namespace sp::log;

namespace {

struct BlobHeader {
    bool compressed = false;
    std::string content_hash;
    size_t payload_offset = 0;
};

// nullopt when the bytes carry no usable frame (pre-framing blobs).
std::optional<BlobHeader> parseHeader(const std::vector<uint8_t>& raw) {
    if (raw.size() <= 8) return std::nullopt;

    const uint32_t metaLen = (static_cast<uint32_t>(raw[0]) << 24) | (static_cast<uint32_t>(raw[1]) << 16) |
                             (static_cast<uint32_t>(raw[2]) << 8) | static_cast<uint32_t>(raw[3]);
    if (metaLen == 0 || metaLen >= ObjectStore::MAX_METADATA_LEN || 4 + metaLen >= raw.size()) return std::nullopt;

    const auto meta = nlohmann::json::parse(raw.begin() + 4, raw.begin() + 4 + metaLen, nullptr, false);
    if (meta.is_discarded() || !meta.is_object()) return std::nullopt;

    const auto compressed = meta.find("compressed");
    const auto hash = meta.find("content_hash");
    if (compressed == meta.end() || !compressed->is_boolean() || hash == meta.end() || !hash->is_string())
        return std::nullopt;

    return BlobHeader{compressed->get<bool>(), hash->get<std::string>(), 4 + metaLen};
}

}

ObjectStore::ObjectStore(std::shared_ptr<storage::StorageEngine> engine, const int compressionLevel)
    : engine_(std::move(engine)), compressionLevel_(compressionLevel) {
    if (!engine_) throw std::invalid_argument("ObjectStore requires a storage engine");
}

std::filesystem::path ObjectStore::blobPath(const std::string& saveId, const std::string& path) {
    return std::filesystem::path(repo::OBJECTS_DIR) / (saveId + "_" + path);
}

std::filesystem::path ObjectStore::deltaSetPath(const std::string& saveId) {
    return std::filesystem::path(repo::OBJECTS_DIR) / ("delta_" + saveId + ".json");
}

void ObjectStore::putBlob(const std::string& saveId, const std::string& path,
                          const std::vector<uint8_t>& content, const Compression compression) {
    // an uncompressed empty payload would not satisfy the frame check on read
    const bool compress = compression == Compression::On || content.empty();

    const nlohmann::json meta = {
        {"compressed", compress},
        {"content_hash", crypto::sha256Hex(content)}
    };
    const auto metaStr = meta.dump();

    std::vector<uint8_t> payload;
    if (compress) payload = util::GzipCompressor(compressionLevel_).compress(content);

    const auto& body = compress ? payload : content;
    const auto metaLen = static_cast<uint32_t>(metaStr.size());

    std::vector<uint8_t> framed;
    framed.reserve(4 + metaStr.size() + body.size());
    framed.push_back(static_cast<uint8_t>(metaLen >> 24));
    framed.push_back(static_cast<uint8_t>(metaLen >> 16));
    framed.push_back(static_cast<uint8_t>(metaLen >> 8));
    framed.push_back(static_cast<uint8_t>(metaLen));
    framed.insert(framed.end(), metaStr.begin(), metaStr.end());
    framed.insert(framed.end(), body.begin(), body.end());

    engine_->writeFile(blobPath(saveId, path), framed);
    Registry::store()->debug("[ObjectStore] Stored blob {}@{} ({} -> {} bytes)", path, saveId, content.size(), framed.size());
}

std::vector<uint8_t> ObjectStore::getBlob(const std::string& saveId, const std::string& path) const {
    const auto raw = engine_->readFile(blobPath(saveId, path));
    if (!raw) throw NotFound("No blob for {} in save {}", path, saveId);

    const auto header = parseHeader(*raw);
    if (!header) {
        Registry::store()->warn("[ObjectStore] Blob {}@{} has no frame, returning raw bytes", path, saveId);
        return *raw;
    }

    const std::span<const uint8_t> payload(raw->data() + header->payload_offset, raw->size() - header->payload_offset);

    std::vector<uint8_t> content;
    if (header->compressed) {
        auto inflated = util::GzipCompressor().decompress(payload);
        if (!inflated) throw IntegrityError("Blob {}@{} is not a valid gzip stream", path, saveId);
        content = std::move(*inflated);
    } else content.assign(payload.begin(), payload.end());

    if (crypto::sha256Hex(content) != header->content_hash) {
        Registry::store()->error("[ObjectStore] Content hash mismatch for {}@{}", path, saveId);
        throw IntegrityError("Content hash mismatch for blob {} in save {}", path, saveId);
    }

    return content;
}

bool ObjectStore::hasBlob(const std::string& saveId, const std::string& path) const {
    const auto p = blobPath(saveId, path);
    return engine_->exists(p) && !engine_->isDirectory(p);
}

void ObjectStore::putDeltaSet(const std::string& saveId, std::vector<DeltaRecord> deltas, const Compression compression) {
    if (compression == Compression::On) {
        for (auto& d : deltas) {
            if (!d.hasPatch() || d.compressed) continue;
            d.patch = delta::encodePatch(*d.patch, compressionLevel_);
            d.compressed = true;
        }
    }

    const DeltaSet set{saveId, std::move(deltas)};
    const nlohmann::json j = set;
    engine_->writeFile(deltaSetPath(saveId), util::toBytes(j.dump(2)));
    Registry::store()->debug("[ObjectStore] Stored delta set {} ({} records)", saveId, set.deltas.size());
}

DeltaSet ObjectStore::getDeltaSet(const std::string& saveId, const PatchForm form) const {
    const auto raw = engine_->readFile(deltaSetPath(saveId));
    if (!raw) throw NotFound("No delta set for save {}", saveId);

    DeltaSet set;
    try {
        set = nlohmann::json::parse(raw->begin(), raw->end()).get<DeltaSet>();
    } catch (const nlohmann::json::exception& e) {
        throw IntegrityError("Delta set for save {} is unreadable: {}", saveId, e.what());
    } catch (const std::invalid_argument& e) {
        throw IntegrityError("Delta set for save {} is unreadable: {}", saveId, e.what());
    }

    if (form == PatchForm::Stored) return set;

    for (auto& d : set.deltas) {
        if (!d.compressed) continue;
        if (d.hasPatch()) d.patch = delta::decodePatch(*d.patch);
        d.compressed = false;
    }

    return set;
}

bool ObjectStore::hasDeltaSet(const std::string& saveId) const {
    return engine_->exists(deltaSetPath(saveId));
}
