#pragma once

#include "checkout/model/Action.hpp"
#include "ignore/IgnoreMatcher.hpp"

#include <string>
#include <vector>

namespace sp::catalog::model {
struct SaveRecord;
}

namespace sp::checkout {

struct Planner {
    // currentFiles must already exclude the metadata directory.
    static std::vector<model::Action> build(const catalog::model::SaveRecord& target,
                                            const std::vector<std::string>& currentFiles,
                                            const std::vector<ignore::Pattern>& patterns);
};

}
