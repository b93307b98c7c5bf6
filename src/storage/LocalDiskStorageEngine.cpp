#include "storage/LocalDiskStorageEngine.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <utility>

using namespace sp::storage;
using namespace sp::error;
using namespace sp::log;

LocalDiskStorageEngine::LocalDiskStorageEngine(std::filesystem::path root_dir)
    : root(std::move(root_dir)) {
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        throw IOError("Storage root is not a directory: {}", root.string());
}

fs::path LocalDiskStorageEngine::getAbsolutePath(const fs::path& relPath) const {
    const auto rel = normalizePath(relPath);
    return rel.empty() ? root : root / rel;
}

std::optional<std::vector<uint8_t>> LocalDiskStorageEngine::readFile(const fs::path& relPath) const {
    const auto abs = getAbsolutePath(relPath);

    std::error_code ec;
    const auto st = fs::status(abs, ec);
    if (ec || !fs::exists(st)) return std::nullopt;
    if (fs::is_directory(st)) throw IOError("Cannot read a directory as a file: {}", relPath.string());

    try {
        return util::readFileToVector(abs);
    } catch (const std::runtime_error& e) {
        Registry::storage()->error("[LocalDiskStorageEngine] {}", e.what());
        throw IOError("Failed to read {}: {}", relPath.string(), e.what());
    }
}

void LocalDiskStorageEngine::writeFile(const fs::path& relPath, const std::vector<uint8_t>& data) {
    const auto abs = getAbsolutePath(relPath);

    std::error_code ec;
    if (abs.has_parent_path()) fs::create_directories(abs.parent_path(), ec);
    if (ec) throw IOError("Failed to create parent directories for {}: {}", relPath.string(), ec.message());

    try {
        util::writeFile(abs, data);
    } catch (const std::runtime_error& e) {
        Registry::storage()->error("[LocalDiskStorageEngine] {}", e.what());
        throw IOError("Failed to write {}: {}", relPath.string(), e.what());
    }
}

bool LocalDiskStorageEngine::deleteFile(const fs::path& relPath) {
    std::error_code ec;
    const bool removed = fs::remove(getAbsolutePath(relPath), ec);
    if (ec) throw IOError("Failed to delete {}: {}", relPath.string(), ec.message());
    return removed;
}

void LocalDiskStorageEngine::mkdirs(const fs::path& relPath) {
    std::error_code ec;
    fs::create_directories(getAbsolutePath(relPath), ec);
    if (ec) throw IOError("Failed to create directory {}: {}", relPath.string(), ec.message());
}

bool LocalDiskStorageEngine::exists(const fs::path& relPath) const {
    std::error_code ec;
    return fs::exists(getAbsolutePath(relPath), ec);
}

bool LocalDiskStorageEngine::isDirectory(const fs::path& relPath) const {
    std::error_code ec;
    return fs::is_directory(getAbsolutePath(relPath), ec);
}

void LocalDiskStorageEngine::walk(const fs::path& walkRoot, const WalkFn& fn) const {
    const auto abs = getAbsolutePath(walkRoot);
    std::error_code ec;
    if (!fs::is_directory(abs, ec)) return;
    walkDir(abs, fn);
}

void LocalDiskStorageEngine::walkDir(const fs::path& absDir, const WalkFn& fn) const {
    std::vector<fs::directory_entry> entries;
    try {
        for (const auto& entry : fs::directory_iterator(absDir)) entries.push_back(entry);
    } catch (const fs::filesystem_error& e) {
        throw IOError("Failed to list {}: {}", absDir.string(), e.what());
    }

    std::ranges::sort(entries, {}, [](const fs::directory_entry& e) { return e.path().filename().string(); });

    for (const auto& entry : entries) {
        std::error_code ec;
        // symlinked directories are reported as plain entries and never followed
        const bool dir = entry.is_directory(ec) && !entry.is_symlink(ec);
        const auto rel = fs::path(entry.path().lexically_relative(root).generic_string());

        if (fn(rel, dir) == WalkAction::SkipSubtree || !dir) continue;
        walkDir(entry.path(), fn);
    }
}
