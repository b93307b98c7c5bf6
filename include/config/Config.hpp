#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace sp::config {

constexpr static unsigned int DEFAULT_MAX_CHAIN_LENGTH = 10;
constexpr static int DEFAULT_COMPRESSION_LEVEL = 6;

struct StorageConfig {
    unsigned int max_chain_length = DEFAULT_MAX_CHAIN_LENGTH; // 0 disables forced checkpoints
    bool compression = true;
    int compression_level = DEFAULT_COMPRESSION_LEVEL;        // zlib: -1 (default) or 0..9
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum savepoint = spdlog::level::info;   // user-facing operation summaries
    spdlog::level::level_enum store     = spdlog::level::warn;   // legacy blobs, framing problems
    spdlog::level::level_enum delta     = spdlog::level::warn;   // checkpoints, chain diagnostics
    spdlog::level::level_enum catalog   = spdlog::level::warn;
    spdlog::level::level_enum checkout  = spdlog::level::info;
    spdlog::level::level_enum storage   = spdlog::level::warn;   // underlying I/O issues
    spdlog::level::level_enum config    = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
};

struct Config {
    StorageConfig storage;
    LoggingConfig logging;

    void validate() const;
};

// Missing file yields defaults; malformed content throws error::ConfigError.
Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);
std::string dumpConfig(const Config& cfg);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

}
