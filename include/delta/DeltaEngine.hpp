#pragma once

#include "config/Config.hpp"
#include "delta/model/CompressionStats.hpp"
#include "delta/model/DeltaRecord.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sp::store {
class ObjectStore;
}

namespace sp::catalog {
class Catalog;
namespace model {
struct SaveRecord;
}
}

namespace sp::delta {

using Content = std::vector<uint8_t>;

// Full content of a path as of a save.
using ContentResolver = std::function<Content(const std::string& path, const std::string& saveId)>;

// Current working-tree content of a tracked path.
using ContentReader = std::function<Content(const std::string& path)>;

class DeltaEngine {
public:
    DeltaEngine(std::shared_ptr<store::ObjectStore> store,
                std::shared_ptr<catalog::Catalog> catalog,
                config::StorageConfig cfg = {});

    // Either side may be absent (new or deleted file).
    static model::DeltaRecord computeDelta(const std::optional<Content>& oldContent,
                                           const std::optional<Content>& newContent,
                                           const std::string& path,
                                           const std::string& baseId);

    // nullopt for deletion records. Throws IntegrityError on a hash mismatch
    // or a new-file record without a base, PatchError on a bad edit script.
    static std::optional<Content> applyDelta(const model::DeltaRecord& delta, const ContentResolver& resolve);

    // Content of path as of saveId, replaying deltas back to the nearest blob.
    [[nodiscard]] Content resolve(const std::string& path, const std::string& saveId) const;

    // Hops from saveId back to the nearest save holding a full blob for path.
    [[nodiscard]] unsigned int chainLength(const std::string& path, const std::string& saveId) const;

    // Writes blobs for new files and checkpoints, then persists the DeltaSet.
    model::DeltaSet storeSave(const std::string& saveId,
                              const std::vector<std::string>& files,
                              const ContentReader& readCurrent,
                              const catalog::model::SaveRecord* base);

    [[nodiscard]] model::CompressionStats compressionStats(const std::string& saveId) const;

    [[nodiscard]] const config::StorageConfig& storageConfig() const { return cfg_; }

    // While the outermost scope is open, each DeltaSet is read from the store
    // once and kept with its patches still encoded; only the patch a hop
    // applies is decoded. DeltaSets are never rewritten once stored.
    class CacheScope {
    public:
        explicit CacheScope(const DeltaEngine& engine);
        ~CacheScope();

        CacheScope(const CacheScope&) = delete;
        CacheScope& operator=(const CacheScope&) = delete;

    private:
        const DeltaEngine& engine_;
    };

private:
    std::shared_ptr<store::ObjectStore> store_;
    std::shared_ptr<catalog::Catalog> catalog_;
    config::StorageConfig cfg_;

    mutable std::unordered_map<std::string, model::DeltaSet> setCache_;
    mutable unsigned int cacheDepth_ = 0;

    Content resolveBounded(const std::string& path, const std::string& saveId, size_t hops) const;
    const model::DeltaSet& cachedDeltaSet(const std::string& saveId) const;
};

}
