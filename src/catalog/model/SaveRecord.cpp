#include "catalog/model/SaveRecord.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace sp::catalog::model;

bool SaveRecord::tracks(const std::string& path) const {
    return std::ranges::binary_search(files, path);
}

void sp::catalog::model::to_json(nlohmann::json& j, const SaveRecord& r) {
    j = {
        {"id", r.id},
        {"label", r.label},
        {"created_at", util::timestampToString(r.created_at)},
        {"files", r.files}
    };
    if (r.base_id) j["base_id"] = *r.base_id;
}

void sp::catalog::model::from_json(const nlohmann::json& j, SaveRecord& r) {
    r.id = j.at("id").get<std::string>();
    r.label = j.at("label").get<std::string>();
    r.created_at = util::parseTimestamp(j.at("created_at").get<std::string>());
    r.files = j.at("files").get<std::vector<std::string>>();
    std::ranges::sort(r.files);

    if (const auto it = j.find("base_id"); it != j.end() && !it->is_null())
        r.base_id = it->get<std::string>();
    else r.base_id.reset();
}
