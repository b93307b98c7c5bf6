#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "error/Error.hpp"

#include <filesystem>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace sp::config {

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void Config::validate() const {
    if (storage.compression_level < -1 || storage.compression_level > 9)
        throw error::ConfigError("storage.compression_level must be -1 or 0..9, got {}", storage.compression_level);
}

static Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!YAML::convert<Config>::decode(root, cfg))
        throw error::ConfigError("Configuration root must be a map");
    cfg.validate();
    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) return {};

    try {
        return decodeRoot(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw error::ConfigError("Failed to parse {}: {}", path.string(), e.what());
    }
}

Config parseConfig(const std::string& yaml) {
    try {
        return decodeRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw error::ConfigError("Failed to parse configuration: {}", e.what());
    }
}

std::string dumpConfig(const Config& cfg) {
    YAML::Emitter out;
    out << YAML::convert<Config>::encode(cfg);
    return std::string(out.c_str()) + "\n";
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"storage", c.storage},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"max_chain_length", c.max_chain_length},
        {"compression", c.compression},
        {"compression_level", c.compression_level}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    const auto& sub = c.levels.subsystem_levels;
    j = {
        {"console_level", levelName(c.levels.console_log_level)},
        {"file_level", levelName(c.levels.file_log_level)},
        {"subsystems", {
            {"savepoint", levelName(sub.savepoint)},
            {"store", levelName(sub.store)},
            {"delta", levelName(sub.delta)},
            {"catalog", levelName(sub.catalog)},
            {"checkout", levelName(sub.checkout)},
            {"storage", levelName(sub.storage)},
            {"config", levelName(sub.config)}
        }}
    };
}

}
