#include "repo/Repository.hpp"
#include "repo/Layout.hpp"
#include "repo/WorkingTree.hpp"
#include "catalog/Catalog.hpp"
#include "checkout/Reconciler.hpp"
#include "delta/DeltaEngine.hpp"
#include "store/ObjectStore.hpp"
#include "storage/StorageEngine.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/bytes.hpp"
#include "util/timestamp.hpp"

#include <chrono>
#include <stdexcept>

using namespace sp::repo;
using namespace sp::catalog;
using namespace sp::catalog::model;
using namespace sp::error;
using namespace sp::log;

Repository::Repository(std::shared_ptr<storage::StorageEngine> engine, sp::config::Config cfg)
    : engine_(std::move(engine)), cfg_(std::move(cfg)) {
    if (!engine_) throw std::invalid_argument("Repository requires a storage engine");
    cfg_.validate();

    catalog_ = std::make_shared<Catalog>(engine_);
    store_ = std::make_shared<store::ObjectStore>(engine_, cfg_.storage.compression_level);
    deltas_ = std::make_shared<delta::DeltaEngine>(store_, catalog_, cfg_.storage);
}

Repository::~Repository() = default;

bool Repository::isInitialized() const {
    return engine_->isDirectory(std::filesystem::path(META_DIR));
}

void Repository::requireInitialized() const {
    if (!isInitialized()) throw NotInitialized("Not a savepoint repository (no {} directory); run 'savepoint init' first", META_DIR);
}

void Repository::initRepository() {
    if (engine_->exists(std::filesystem::path(META_DIR)))
        throw AlreadyInitialized("Repository already initialized ({} exists)", META_DIR);

    engine_->mkdirs(std::filesystem::path(OBJECTS_DIR));
    Catalog::create(*engine_);
    engine_->writeFile(std::filesystem::path(CONFIG_FILE), util::toBytes(sp::config::dumpConfig(cfg_)));
    catalog_->reload();

    Registry::savepoint()->info("[Repository] Initialized empty repository");
}

SaveRecord Repository::saveState(const std::string& label) {
    requireInitialized();
    catalog_->reload();

    const auto files = trackedFiles(listWorkingFiles(*engine_), loadIgnorePatterns(*engine_));
    if (files.empty()) throw NoFilesToSave("No files to save");

    SaveRecord record;
    record.label = label;
    record.files = files;
    record.created_at = catalog_->clampTimestamp(util::now());
    record.id = Catalog::nextId(label, record.created_at, files);

    // same label, files and microsecond as an existing save
    while (catalog_->tryFind(record.id)) {
        record.created_at += std::chrono::microseconds(1);
        record.id = Catalog::nextId(label, record.created_at, files);
    }

    const auto base = catalog_->latest();
    if (base) record.base_id = base->id;

    const auto read = [&](const std::string& path) {
        auto content = engine_->readFile(path);
        if (!content) throw IOError("{} disappeared while saving", path);
        return std::move(*content);
    };

    const auto set = deltas_->storeSave(record.id, files, read, base ? &*base : nullptr);
    catalog_->append(record);

    Registry::savepoint()->info("[Repository] Saved {} '{}' ({} files, {} delta records)",
                                record.id, label, files.size(), set.deltas.size());
    return record;
}

std::vector<SaveRecord> Repository::listSaves() const {
    requireInitialized();
    catalog_->reload();
    return catalog_->all();
}

sp::checkout::model::Summary Repository::checkout(const std::string& saveId) {
    requireInitialized();
    catalog_->reload();
    return checkout::Reconciler(engine_, catalog_, deltas_).checkout(saveId);
}

std::optional<sp::checkout::model::Summary> Repository::checkoutLatest() {
    requireInitialized();
    catalog_->reload();
    const auto last = catalog_->latest();
    if (!last) return std::nullopt;
    return checkout::Reconciler(engine_, catalog_, deltas_).checkout(last->id);
}

std::vector<std::pair<std::string, bool>> Repository::checkIgnore(const std::vector<std::string>& paths) const {
    requireInitialized();
    const auto patterns = loadIgnorePatterns(*engine_);

    std::vector<std::pair<std::string, bool>> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
        const auto normalized = storage::normalizePath(p);
        out.emplace_back(p, isMetadataPath(normalized) || ignore::isIgnored(normalized, patterns));
    }
    return out;
}

sp::delta::model::CompressionStats Repository::compressionStats(const std::string& saveId) const {
    requireInitialized();
    catalog_->reload();
    return deltas_->compressionStats(saveId);
}

unsigned int Repository::chainLength(const std::string& path, const std::string& saveId) const {
    requireInitialized();
    catalog_->reload();
    return deltas_->chainLength(path, saveId);
}
