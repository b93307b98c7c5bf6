#pragma once

#include <string_view>

namespace sp::repo {

inline constexpr std::string_view META_DIR     = ".savepoint";
inline constexpr std::string_view OBJECTS_DIR  = ".savepoint/objects";
inline constexpr std::string_view CATALOG_FILE = ".savepoint/catalog.json";
inline constexpr std::string_view CONFIG_FILE  = ".savepoint/config.yaml";
inline constexpr std::string_view LOG_DIR      = ".savepoint/logs";
inline constexpr std::string_view IGNORE_FILE  = ".savepointignore";

// True for the metadata directory itself and anything beneath it.
inline bool isMetadataPath(const std::string_view path) {
    if (!path.starts_with(META_DIR)) return false;
    return path.size() == META_DIR.size() || path[META_DIR.size()] == '/';
}

}
