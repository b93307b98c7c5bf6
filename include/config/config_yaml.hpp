#pragma once

#include "config/Config.hpp"
#include "error/Error.hpp"

#include <string>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sp::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum parseLevel(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    const auto str = node.as<std::string>();
    const auto lvl = spdlog::level::from_str(str);
    // from_str maps anything unknown to "off"
    if (lvl == spdlog::level::off && str != "off")
        throw sp::error::ConfigError("Invalid log level: {}", str);
    return lvl;
}

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["max_chain_length"] = rhs.max_chain_length;
        node["compression"] = rhs.compression;
        node["compression_level"] = rhs.compression_level;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_chain_length = node["max_chain_length"].as<unsigned int>(DEFAULT_MAX_CHAIN_LENGTH);
        rhs.compression = node["compression"].as<bool>(true);
        rhs.compression_level = node["compression_level"].as<int>(DEFAULT_COMPRESSION_LEVEL);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["savepoint"] = to_std_string(spdlog::level::to_string_view(rhs.savepoint));
        node["store"]     = to_std_string(spdlog::level::to_string_view(rhs.store));
        node["delta"]     = to_std_string(spdlog::level::to_string_view(rhs.delta));
        node["catalog"]   = to_std_string(spdlog::level::to_string_view(rhs.catalog));
        node["checkout"]  = to_std_string(spdlog::level::to_string_view(rhs.checkout));
        node["storage"]   = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["config"]    = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig defaults;
        rhs.savepoint = parseLevel(node["savepoint"], defaults.savepoint);
        rhs.store     = parseLevel(node["store"], defaults.store);
        rhs.delta     = parseLevel(node["delta"], defaults.delta);
        rhs.catalog   = parseLevel(node["catalog"], defaults.catalog);
        rhs.checkout  = parseLevel(node["checkout"], defaults.checkout);
        rhs.storage   = parseLevel(node["storage"], defaults.storage);
        rhs.config    = parseLevel(node["config"], defaults.config);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystems"] = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const LogLevelsConfig defaults;
        rhs.console_log_level = parseLevel(node["console_level"], defaults.console_log_level);
        rhs.file_log_level = parseLevel(node["file_level"], defaults.file_log_level);
        if (const auto sub = node["subsystems"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        return convert<LogLevelsConfig>::encode(rhs.levels);
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        return convert<LogLevelsConfig>::decode(node, rhs.levels);
    }
};

template<>
struct convert<Config> {
    static Node encode(const Config& rhs) {
        Node node;
        node["storage"] = rhs.storage;
        node["logging"] = rhs.logging;
        return node;
    }

    static bool decode(const Node& node, Config& rhs) {
        if (!node.IsMap()) return false;
        if (const auto storage = node["storage"]) convert<StorageConfig>::decode(storage, rhs.storage);
        if (const auto logging = node["logging"]) convert<LoggingConfig>::decode(logging, rhs.logging);
        return true;
    }
};

}
