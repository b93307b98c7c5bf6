#include "delta/model/DeltaRecord.hpp"
#include "util/bytes.hpp"
#include "util/hex.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace sp::delta::model;

const DeltaRecord* DeltaSet::find(const std::string& path) const {
    for (const auto& d : deltas)
        if (d.path == path) return &d;
    return nullptr;
}

void sp::delta::model::to_json(nlohmann::json& j, const DeltaRecord& d) {
    j = {
        {"path", d.path},
        {"is_new", d.is_new},
        {"is_deleted", d.is_deleted},
        {"base_id", d.base_id},
        {"content_hash", d.content_hash},
        {"compressed", d.compressed}
    };

    if (!d.patch) j["patch"] = nullptr;
    else if (d.compressed) j["patch"] = *d.patch;
    else j["patch"] = util::toHex(util::asBytes(*d.patch));
}

void sp::delta::model::from_json(const nlohmann::json& j, DeltaRecord& d) {
    d.path = j.at("path").get<std::string>();
    d.is_new = j.value("is_new", false);
    d.is_deleted = j.value("is_deleted", false);
    d.base_id = j.value("base_id", std::string{});
    d.content_hash = j.at("content_hash").get<std::string>();
    d.compressed = j.value("compressed", false);

    const auto it = j.find("patch");
    if (it == j.end() || it->is_null()) {
        d.patch.reset();
        return;
    }

    const auto encoded = it->get<std::string>();
    if (d.compressed) {
        d.patch = encoded;
        return;
    }

    const auto raw = util::fromHex(encoded);
    if (!raw) throw std::invalid_argument("Patch for " + d.path + " is not valid hex");
    d.patch = std::string(raw->begin(), raw->end());
}

void sp::delta::model::to_json(nlohmann::json& j, const DeltaSet& s) {
    j = {
        {"save_id", s.save_id},
        {"deltas", s.deltas}
    };
}

void sp::delta::model::from_json(const nlohmann::json& j, DeltaSet& s) {
    s.save_id = j.at("save_id").get<std::string>();
    s.deltas = j.at("deltas").get<std::vector<DeltaRecord>>();
}
