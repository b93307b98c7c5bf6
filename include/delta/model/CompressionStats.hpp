#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace sp::delta::model {

struct PatchStats {
    std::string path;
    size_t uncompressed = 0;
    size_t compressed = 0;

    [[nodiscard]] int64_t saving() const {
        return static_cast<int64_t>(uncompressed) - static_cast<int64_t>(compressed);
    }
};

struct CompressionStats {
    std::string save_id;
    std::vector<PatchStats> files;
    size_t total_uncompressed = 0;
    size_t total_compressed = 0;

    // compressed / uncompressed, 0 when the save carries no patches
    [[nodiscard]] double ratio() const;
};

void to_json(nlohmann::json& j, const PatchStats& s);
void to_json(nlohmann::json& j, const CompressionStats& s);

}
