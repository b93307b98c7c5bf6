#include "delta/DeltaEngine.hpp"
#include "delta/Patch.hpp"
#include "catalog/Catalog.hpp"
#include "store/ObjectStore.hpp"
#include "crypto/Hash.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/bytes.hpp"

#include <stdexcept>
#include <unordered_set>
#include <utility>

using namespace sp::delta;
using namespace sp::delta::model;
using namespace sp::catalog::model;
using namespace sp::store;
using namespace sp::error;
using namespace sp::log;

DeltaEngine::DeltaEngine(std::shared_ptr<ObjectStore> store,
                         std::shared_ptr<catalog::Catalog> catalog,
                         config::StorageConfig cfg)
    : store_(std::move(store)), catalog_(std::move(catalog)), cfg_(cfg) {
    if (!store_ || !catalog_) throw std::invalid_argument("DeltaEngine requires an object store and a catalog");
}

DeltaRecord DeltaEngine::computeDelta(const std::optional<Content>& oldContent,
                                      const std::optional<Content>& newContent,
                                      const std::string& path,
                                      const std::string& baseId) {
    DeltaRecord d;
    d.path = path;

    if (!oldContent) {
        if (!newContent) throw std::invalid_argument("computeDelta needs at least one side for " + path);
        d.is_new = true;
        d.content_hash = crypto::sha256Hex(*newContent);
        return d;
    }

    d.base_id = baseId;

    if (!newContent) {
        d.is_deleted = true;
        d.content_hash = crypto::sha256Hex(*oldContent);
        return d;
    }

    d.content_hash = crypto::sha256Hex(*newContent);
    if (*oldContent != *newContent) d.patch = makePatch(util::asStringView(*oldContent), util::asStringView(*newContent));
    return d;
}

std::optional<Content> DeltaEngine::applyDelta(const DeltaRecord& delta, const ContentResolver& resolve) {
    if (delta.is_deleted) return std::nullopt;

    if (delta.is_new) {
        // new-file content lives in a blob; reaching here means it is missing
        if (delta.base_id.empty())
            throw IntegrityError("New file {} has no stored blob to resolve from", delta.path);
        return resolve(delta.path, delta.base_id);
    }

    if (!delta.hasPatch()) return resolve(delta.path, delta.base_id);

    const auto base = resolve(delta.path, delta.base_id);
    const auto script = delta.compressed ? decodePatch(*delta.patch) : *delta.patch;
    const auto result = util::toBytes(applyPatch(util::asStringView(base), script));

    if (crypto::sha256Hex(result) != delta.content_hash)
        throw IntegrityError("Content hash mismatch after patching {} on top of save {}", delta.path, delta.base_id);

    return result;
}

DeltaEngine::CacheScope::CacheScope(const DeltaEngine& engine) : engine_(engine) {
    ++engine_.cacheDepth_;
}

DeltaEngine::CacheScope::~CacheScope() {
    if (--engine_.cacheDepth_ == 0) engine_.setCache_.clear();
}

const DeltaSet& DeltaEngine::cachedDeltaSet(const std::string& saveId) const {
    if (const auto it = setCache_.find(saveId); it != setCache_.end()) return it->second;
    return setCache_.emplace(saveId, store_->getDeltaSet(saveId, PatchForm::Stored)).first->second;
}

Content DeltaEngine::resolve(const std::string& path, const std::string& saveId) const {
    const CacheScope scope(*this);
    return resolveBounded(path, saveId, 0);
}

Content DeltaEngine::resolveBounded(const std::string& path, const std::string& saveId, const size_t hops) const {
    // every legitimate hop moves to an earlier save
    if (hops > catalog_->size() + 1)
        throw IntegrityError("Delta chain for {} does not terminate (stopped at save {})", path, saveId);

    if (store_->hasBlob(saveId, path)) return store_->getBlob(saveId, path);

    if (!catalog_->tryFind(saveId)) throw NotFound("Save {} not found while resolving {}", saveId, path);

    const auto* record = cachedDeltaSet(saveId).find(path);
    if (!record) throw NotFound("No delta for {} in save {}", path, saveId);

    const auto next = [&](const std::string& p, const std::string& id) { return resolveBounded(p, id, hops + 1); };
    auto content = applyDelta(*record, next);
    if (!content) throw NotFound("{} was deleted in save {}", path, saveId);

    return std::move(*content);
}

unsigned int DeltaEngine::chainLength(const std::string& path, const std::string& saveId) const {
    unsigned int count = 0;
    std::string current = saveId;

    while (!current.empty() && count <= catalog_->size()) {
        const auto* rec = catalog_->tryFind(current);
        if (!rec || store_->hasBlob(current, path)) break;
        current = rec->base_id.value_or("");
        ++count;
    }

    return count;
}

DeltaSet DeltaEngine::storeSave(const std::string& saveId,
                                const std::vector<std::string>& files,
                                const ContentReader& readCurrent,
                                const SaveRecord* base) {
    const auto compression = cfg_.compression ? Compression::On : Compression::Off;
    const CacheScope scope(*this);

    DeltaSet set;
    set.save_id = saveId;
    set.deltas.reserve(files.size());

    for (const auto& file : files) {
        auto current = readCurrent(file);

        if (!base || !base->tracks(file)) {
            set.deltas.push_back(computeDelta(std::nullopt, current, file, ""));
            store_->putBlob(saveId, file, current, compression);
            continue;
        }

        auto d = computeDelta(resolve(file, base->id), current, file, base->id);

        if (cfg_.max_chain_length > 0 && d.hasPatch()) {
            if (const auto len = chainLength(file, base->id); len >= cfg_.max_chain_length) {
                Registry::delta()->debug("[DeltaEngine] Checkpointing {} at {} (chain length {})", file, saveId, len);
                store_->putBlob(saveId, file, current, compression);
            }
        }

        set.deltas.push_back(std::move(d));
    }

    if (base) {
        const std::unordered_set<std::string> present(files.begin(), files.end());
        for (const auto& file : base->files) {
            if (present.contains(file)) continue;
            set.deltas.push_back(computeDelta(resolve(file, base->id), std::nullopt, file, base->id));
        }
    }

    store_->putDeltaSet(saveId, set.deltas, compression);
    setCache_.erase(saveId);
    return set;
}

CompressionStats DeltaEngine::compressionStats(const std::string& saveId) const {
    if (!catalog_->tryFind(saveId)) throw NotFound("Save {} not found", saveId);

    CompressionStats stats;
    stats.save_id = saveId;

    for (const auto& d : store_->getDeltaSet(saveId).deltas) {
        if (!d.hasPatch()) continue;

        PatchStats ps;
        ps.path = d.path;
        ps.uncompressed = d.patch->size();
        ps.compressed = encodePatch(*d.patch, store_->compressionLevel()).size();

        stats.total_uncompressed += ps.uncompressed;
        stats.total_compressed += ps.compressed;
        stats.files.push_back(std::move(ps));
    }

    return stats;
}
