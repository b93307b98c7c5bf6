#pragma once

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sp::delta::model {

// How one file changed between a save and its base.
struct DeltaRecord {
    std::string path;
    bool is_new = false;
    bool is_deleted = false;
    std::string base_id;                // empty when is_new
    std::optional<std::string> patch;   // edit script, or its encoded form when compressed
    std::string content_hash;           // SHA-256 of the resulting content (pre-deletion content if is_deleted)
    bool compressed = false;            // patch holds hex(gzip(script))

    [[nodiscard]] bool hasPatch() const { return patch && !patch->empty(); }
};

struct DeltaSet {
    std::string save_id;
    std::vector<DeltaRecord> deltas;

    [[nodiscard]] const DeltaRecord* find(const std::string& path) const;
};

// Uncompressed patches are hex encoded on the wire so arbitrary bytes survive JSON.
void to_json(nlohmann::json& j, const DeltaRecord& d);
void from_json(const nlohmann::json& j, DeltaRecord& d);
void to_json(nlohmann::json& j, const DeltaSet& s);
void from_json(const nlohmann::json& j, DeltaSet& s);

}
