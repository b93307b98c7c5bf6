#pragma once

#include "catalog/model/SaveRecord.hpp"
#include "checkout/model/Action.hpp"
#include "config/Config.hpp"
#include "delta/model/CompressionStats.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sp::storage {
class StorageEngine;
}

namespace sp::catalog {
class Catalog;
}

namespace sp::store {
class ObjectStore;
}

namespace sp::delta {
class DeltaEngine;
}

namespace sp::repo {

// Entry point for every user-facing operation on one working tree.
class Repository {
public:
    explicit Repository(std::shared_ptr<storage::StorageEngine> engine, sp::config::Config cfg = {});
    ~Repository();

    [[nodiscard]] bool isInitialized() const;

    // AlreadyInitialized when the metadata directory exists.
    void initRepository();

    // NotInitialized, NoFilesToSave
    catalog::model::SaveRecord saveState(const std::string& label);

    [[nodiscard]] std::vector<catalog::model::SaveRecord> listSaves() const;

    // NotInitialized, NotFound
    sp::checkout::model::Summary checkout(const std::string& saveId);

    // nullopt when there are no saves yet
    std::optional<sp::checkout::model::Summary> checkoutLatest();

    // Each path paired with whether the current ignore file ignores it.
    [[nodiscard]] std::vector<std::pair<std::string, bool>> checkIgnore(const std::vector<std::string>& paths) const;

    [[nodiscard]] delta::model::CompressionStats compressionStats(const std::string& saveId) const;

    [[nodiscard]] unsigned int chainLength(const std::string& path, const std::string& saveId) const;

    [[nodiscard]] const sp::config::Config& config() const { return cfg_; }
    [[nodiscard]] const std::shared_ptr<storage::StorageEngine>& engine() const { return engine_; }

private:
    std::shared_ptr<storage::StorageEngine> engine_;
    sp::config::Config cfg_;
    std::shared_ptr<catalog::Catalog> catalog_;
    std::shared_ptr<store::ObjectStore> store_;
    std::shared_ptr<delta::DeltaEngine> deltas_;

    void requireInitialized() const;
};

}
