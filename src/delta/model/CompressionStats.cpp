#include "delta/model/CompressionStats.hpp"

#include <nlohmann/json.hpp>

using namespace sp::delta::model;

double CompressionStats::ratio() const {
    if (total_uncompressed == 0) return 0.0;
    return static_cast<double>(total_compressed) / static_cast<double>(total_uncompressed);
}

void sp::delta::model::to_json(nlohmann::json& j, const PatchStats& s) {
    j = {
        {"path", s.path},
        {"uncompressed", s.uncompressed},
        {"compressed", s.compressed},
        {"saving", s.saving()}
    };
}

void sp::delta::model::to_json(nlohmann::json& j, const CompressionStats& s) {
    j = {
        {"save_id", s.save_id},
        {"files", s.files},
        {"total_uncompressed", s.total_uncompressed},
        {"total_compressed", s.total_compressed},
        {"ratio", s.ratio()}
    };
}
