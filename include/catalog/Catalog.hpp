#pragma once

#include "catalog/model/SaveRecord.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sp::storage {
class StorageEngine;
}

namespace sp::catalog {

// Ordered, append-only log of saves persisted as one JSON document.
// Insertion order is chronological order; the last record is the latest.
class Catalog {
public:
    static constexpr size_t ID_LENGTH = 12;

    // Loads the persisted document if there is one, otherwise starts empty.
    explicit Catalog(std::shared_ptr<storage::StorageEngine> engine);

    // Writes an empty catalog document, replacing any existing one.
    static void create(storage::StorageEngine& engine);

    static std::string nextId(const std::string& label, util::Timestamp createdAt,
                              const std::vector<std::string>& files);

    // Rejects a base_id that is not the current latest id, duplicate ids and
    // timestamps older than the latest record. Persists on success.
    void append(model::SaveRecord record);

    // NotFound when absent
    [[nodiscard]] const model::SaveRecord& find(const std::string& id) const;
    [[nodiscard]] const model::SaveRecord* tryFind(const std::string& id) const;

    [[nodiscard]] std::optional<model::SaveRecord> latest() const;
    [[nodiscard]] const std::vector<model::SaveRecord>& all() const { return records_; }
    [[nodiscard]] size_t size() const { return records_.size(); }
    [[nodiscard]] bool empty() const { return records_.empty(); }

    // Never earlier than the latest record, so created_at stays non-decreasing.
    [[nodiscard]] util::Timestamp clampTimestamp(util::Timestamp ts) const;

    void reload();

private:
    std::shared_ptr<storage::StorageEngine> engine_;
    std::vector<model::SaveRecord> records_;

    void persist() const;
};

}
