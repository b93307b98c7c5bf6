#pragma once

#include "util/timestamp.hpp"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sp::catalog::model {

struct SaveRecord {
    std::string id;                       // 12 lowercase hex characters
    std::string label;
    util::Timestamp created_at{};
    std::vector<std::string> files;       // sorted, forward-slash, relative
    std::optional<std::string> base_id;   // absent only for the first save

    [[nodiscard]] bool tracks(const std::string& path) const;
};

void to_json(nlohmann::json& j, const SaveRecord& r);
void from_json(const nlohmann::json& j, SaveRecord& r);

}
