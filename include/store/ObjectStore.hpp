#pragma once

#include "config/Config.hpp"
#include "delta/model/DeltaRecord.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace sp::storage {
class StorageEngine;
}

namespace sp::store {

enum class Compression { Off, On };

// Decoded: patches come back as plain edit scripts.
// Stored: compressed patches stay hex(gzip) with compressed == true.
enum class PatchForm { Decoded, Stored };

// Full-content blobs keyed by (saveId, path) and one DeltaSet per save, all
// under the objects directory. Holds no reference to the catalog.
//
// Blob frame: [4-byte big-endian metadata length][metadata JSON][payload]
// where metadata is {"compressed": bool, "content_hash": sha256-hex}.
class ObjectStore {
public:
    static constexpr uint32_t MAX_METADATA_LEN = 1000;

    explicit ObjectStore(std::shared_ptr<storage::StorageEngine> engine,
                         int compressionLevel = config::DEFAULT_COMPRESSION_LEVEL);

    void putBlob(const std::string& saveId, const std::string& path,
                 const std::vector<uint8_t>& content, Compression compression = Compression::On);

    // NotFound when absent, IntegrityError when the stored bytes do not verify.
    [[nodiscard]] std::vector<uint8_t> getBlob(const std::string& saveId, const std::string& path) const;

    [[nodiscard]] bool hasBlob(const std::string& saveId, const std::string& path) const;

    // Patches are stored hex(gzip) when compression is on.
    void putDeltaSet(const std::string& saveId, std::vector<delta::model::DeltaRecord> deltas,
                     Compression compression = Compression::On);

    // With PatchForm::Decoded every returned record has compressed == false.
    [[nodiscard]] delta::model::DeltaSet getDeltaSet(const std::string& saveId,
                                                     PatchForm form = PatchForm::Decoded) const;

    [[nodiscard]] bool hasDeltaSet(const std::string& saveId) const;

    [[nodiscard]] int compressionLevel() const { return compressionLevel_; }

    static std::filesystem::path blobPath(const std::string& saveId, const std::string& path);
    static std::filesystem::path deltaSetPath(const std::string& saveId);

private:
    std::shared_ptr<storage::StorageEngine> engine_;
    int compressionLevel_;
};

}
