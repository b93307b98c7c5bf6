#pragma once

#include "checkout/model/Action.hpp"

#include <memory>
#include <string>

namespace sp::storage {
class StorageEngine;
}

namespace sp::catalog {
class Catalog;
}

namespace sp::delta {
class DeltaEngine;
}

namespace sp::checkout {

// Converges the working tree to a past save without disturbing ignored files.
class Reconciler {
public:
    Reconciler(std::shared_ptr<storage::StorageEngine> engine,
               std::shared_ptr<catalog::Catalog> catalog,
               std::shared_ptr<delta::DeltaEngine> deltas);

    // NotFound for an unknown save id.
    model::Summary checkout(const std::string& saveId);

private:
    std::shared_ptr<storage::StorageEngine> engine_;
    std::shared_ptr<catalog::Catalog> catalog_;
    std::shared_ptr<delta::DeltaEngine> deltas_;
};

}
