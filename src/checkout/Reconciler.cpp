#include "checkout/Reconciler.hpp"
#include "checkout/Executor.hpp"
#include "checkout/Planner.hpp"
#include "catalog/Catalog.hpp"
#include "delta/DeltaEngine.hpp"
#include "storage/StorageEngine.hpp"
#include "repo/Layout.hpp"
#include "repo/WorkingTree.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace sp::checkout;
using namespace sp::log;

Reconciler::Reconciler(std::shared_ptr<storage::StorageEngine> engine,
                       std::shared_ptr<catalog::Catalog> catalog,
                       std::shared_ptr<delta::DeltaEngine> deltas)
    : engine_(std::move(engine)), catalog_(std::move(catalog)), deltas_(std::move(deltas)) {
    if (!engine_ || !catalog_ || !deltas_) throw std::invalid_argument("Reconciler requires engine, catalog and delta engine");
}

model::Summary Reconciler::checkout(const std::string& saveId) {
    const auto target = catalog_->find(saveId);
    const delta::DeltaEngine::CacheScope scope(*deltas_);
    const auto current = repo::listWorkingFiles(*engine_);

    // the target's ignore rules decide what is preserved, so they land first
    bool restored = false;
    if (target.tracks(std::string(repo::IGNORE_FILE))) {
        engine_->writeFile(std::filesystem::path(repo::IGNORE_FILE), deltas_->resolve(std::string(repo::IGNORE_FILE), saveId));
        restored = true;
    }

    const auto patterns = repo::loadIgnorePatterns(*engine_);
    const auto plan = Planner::build(target, current, patterns);

    auto summary = Executor::run(*engine_, *deltas_, saveId, plan);
    summary.ignore_file_restored = restored;

    Registry::checkout()->info("[Reconciler] Checked out {}: {} written, {} deleted, {} ignored files kept",
                               saveId, summary.written, summary.deleted, summary.preserved);
    return summary;
}
