#include "checkout/Planner.hpp"
#include "catalog/model/SaveRecord.hpp"
#include "repo/Layout.hpp"

using namespace sp::checkout;
using namespace sp::checkout::model;
using namespace sp::ignore;

std::vector<Action> Planner::build(const catalog::model::SaveRecord& target,
                                   const std::vector<std::string>& currentFiles,
                                   const std::vector<Pattern>& patterns) {
    std::vector<Action> plan;
    plan.reserve(currentFiles.size() + target.files.size());

    for (const auto& f : currentFiles) {
        if (repo::isMetadataPath(f) || f == repo::IGNORE_FILE) continue;

        if (isIgnored(f, patterns)) plan.push_back({ActionType::Preserve, f});
        else if (!target.tracks(f)) plan.push_back({ActionType::Delete, f});
    }

    for (const auto& f : target.files) {
        if (repo::isMetadataPath(f) || f == repo::IGNORE_FILE) continue;
        if (isIgnored(f, patterns)) continue;
        plan.push_back({ActionType::Write, f});
    }

    return plan;
}
