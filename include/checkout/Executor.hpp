#pragma once

#include "checkout/model/Action.hpp"
#include "delta/DeltaEngine.hpp"

#include <string>
#include <vector>

namespace sp::storage {
class StorageEngine;
}

namespace sp::checkout {

class Executor {
public:
    // Phases run in order: preserve, delete, write, reinstate preserved.
    static model::Summary run(storage::StorageEngine& engine,
                       const delta::DeltaEngine& deltas,
                       const std::string& saveId,
                       const std::vector<model::Action>& plan);
};

}
