#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

namespace fs = std::filesystem;

namespace sp::storage {

enum class StorageType { Local, Memory };

enum class WalkAction { Continue, SkipSubtree };

// Receives paths relative to the engine root, forward-slash separated.
using WalkFn = std::function<WalkAction(const fs::path& relPath, bool isDirectory)>;

// Filesystem primitives every component goes through. All paths are relative
// to the engine root; failures other than "not there" throw error::IOError.
class StorageEngine {
public:
    virtual ~StorageEngine() = default;

    // nullopt when the file does not exist
    [[nodiscard]] virtual std::optional<std::vector<uint8_t>> readFile(const fs::path& relPath) const = 0;

    // Creates missing parent directories and replaces any existing file.
    virtual void writeFile(const fs::path& relPath, const std::vector<uint8_t>& data) = 0;

    // false when there was nothing to delete
    virtual bool deleteFile(const fs::path& relPath) = 0;

    virtual void mkdirs(const fs::path& relPath) = 0;

    [[nodiscard]] virtual bool exists(const fs::path& relPath) const = 0;
    [[nodiscard]] virtual bool isDirectory(const fs::path& relPath) const = 0;

    // Pre-order walk below root (root itself is not reported), siblings in
    // lexicographic order. An empty root walks the whole engine.
    virtual void walk(const fs::path& root, const WalkFn& fn) const = 0;

    [[nodiscard]] virtual StorageType type() const = 0;
};

// Normalizes to the relative, forward-slash form used in manifests.
[[nodiscard]] std::string normalizePath(const fs::path& relPath);

}
