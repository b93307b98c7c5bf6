#include "catalog/Catalog.hpp"
#include "storage/StorageEngine.hpp"
#include "crypto/Hash.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "repo/Layout.hpp"
#include "util/bytes.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace sp::catalog;
using namespace sp::catalog::model;
using namespace sp::error;
using namespace sp::log;

static constexpr int CATALOG_VERSION = 1;

static std::vector<uint8_t> serialize(const std::vector<SaveRecord>& records) {
    const nlohmann::json j = {
        {"version", CATALOG_VERSION},
        {"saves", records}
    };
    return sp::util::toBytes(j.dump(2));
}

Catalog::Catalog(std::shared_ptr<storage::StorageEngine> engine) : engine_(std::move(engine)) {
    if (!engine_) throw std::invalid_argument("Catalog requires a storage engine");
    reload();
}

void Catalog::create(storage::StorageEngine& engine) {
    engine.writeFile(std::filesystem::path(repo::CATALOG_FILE), serialize({}));
}

void Catalog::reload() {
    records_.clear();

    const auto raw = engine_->readFile(std::filesystem::path(repo::CATALOG_FILE));
    if (!raw) return;

    try {
        const auto j = nlohmann::json::parse(raw->begin(), raw->end());
        records_ = j.at("saves").get<std::vector<SaveRecord>>();
    } catch (const nlohmann::json::exception& e) {
        throw IntegrityError("Catalog {} is unreadable: {}", repo::CATALOG_FILE, e.what());
    } catch (const std::runtime_error& e) {
        // bad timestamps surface from parseTimestamp
        throw IntegrityError("Catalog {} is unreadable: {}", repo::CATALOG_FILE, e.what());
    }

    Registry::catalog()->debug("[Catalog] Loaded {} saves", records_.size());
}

void Catalog::persist() const {
    engine_->writeFile(std::filesystem::path(repo::CATALOG_FILE), serialize(records_));
}

std::string Catalog::nextId(const std::string& label, const util::Timestamp createdAt,
                            const std::vector<std::string>& files) {
    crypto::Blake2b h;
    h.update(label).update(util::timestampToString(createdAt));
    for (const auto& f : files) h.update(f);
    return h.hexDigest().substr(0, ID_LENGTH);
}

void Catalog::append(SaveRecord record) {
    const auto last = latest();

    if (last) {
        if (record.base_id != last->id)
            throw std::invalid_argument("Save " + record.id + " must be based on the latest save " + last->id);
        if (record.created_at < last->created_at)
            throw std::invalid_argument("Save " + record.id + " is older than the latest save " + last->id);
    } else if (record.base_id) {
        throw std::invalid_argument("The first save cannot have a base, got " + *record.base_id);
    }

    if (tryFind(record.id)) throw std::invalid_argument("Duplicate save id " + record.id);

    std::ranges::sort(record.files);
    records_.push_back(std::move(record));

    try {
        persist();
    } catch (const Error&) {
        records_.pop_back();
        throw;
    }

    Registry::catalog()->debug("[Catalog] Appended save {} ({} files)", records_.back().id, records_.back().files.size());
}

const SaveRecord& Catalog::find(const std::string& id) const {
    if (const auto* rec = tryFind(id)) return *rec;
    throw NotFound("Save {} not found", id);
}

const SaveRecord* Catalog::tryFind(const std::string& id) const {
    const auto it = std::ranges::find(records_, id, &SaveRecord::id);
    return it == records_.end() ? nullptr : &*it;
}

std::optional<SaveRecord> Catalog::latest() const {
    if (records_.empty()) return std::nullopt;
    return records_.back();
}

sp::util::Timestamp Catalog::clampTimestamp(const util::Timestamp ts) const {
    if (records_.empty()) return ts;
    return std::max(ts, records_.back().created_at);
}
