#include "storage/MemoryStorageEngine.hpp"
#include "error/Error.hpp"

#include <algorithm>
#include <map>

using namespace sp::storage;
using namespace sp::error;

static std::string parentOf(const std::string& p) {
    const auto pos = p.rfind('/');
    return pos == std::string::npos ? std::string{} : p.substr(0, pos);
}

std::optional<std::vector<uint8_t>> MemoryStorageEngine::readFile(const fs::path& relPath) const {
    const auto key = normalizePath(relPath);
    if (dirs_.contains(key)) throw IOError("Cannot read a directory as a file: {}", key);
    const auto it = files_.find(key);
    if (it == files_.end()) return std::nullopt;
    return it->second;
}

void MemoryStorageEngine::writeFile(const fs::path& relPath, const std::vector<uint8_t>& data) {
    const auto key = normalizePath(relPath);
    if (key.empty() || dirs_.contains(key)) throw IOError("Cannot write over a directory: {}", key);
    mkdirs(parentOf(key));
    files_[key] = data;
}

bool MemoryStorageEngine::deleteFile(const fs::path& relPath) {
    const auto key = normalizePath(relPath);
    if (files_.erase(key) > 0) return true;
    if (!dirs_.contains(key)) return false;

    const auto prefix = key + "/";
    const auto child = [&](const std::string& p) { return p.starts_with(prefix); };
    if (std::ranges::any_of(files_, [&](const auto& kv) { return child(kv.first); }) ||
        std::ranges::any_of(dirs_, child))
        throw IOError("Directory not empty: {}", key);

    dirs_.erase(key);
    return true;
}

void MemoryStorageEngine::mkdirs(const fs::path& relPath) {
    auto key = normalizePath(relPath);
    while (!key.empty()) {
        if (files_.contains(key)) throw IOError("A file is in the way of directory {}", key);
        dirs_.insert(key);
        key = parentOf(key);
    }
}

bool MemoryStorageEngine::exists(const fs::path& relPath) const {
    const auto key = normalizePath(relPath);
    return key.empty() || files_.contains(key) || dirs_.contains(key);
}

bool MemoryStorageEngine::isDirectory(const fs::path& relPath) const {
    const auto key = normalizePath(relPath);
    return key.empty() || dirs_.contains(key);
}

void MemoryStorageEngine::walk(const fs::path& root, const WalkFn& fn) const {
    const auto start = normalizePath(root);
    if (!isDirectory(start)) return;

    const auto walkDir = [&](const auto& self, const std::string& dir) -> void {
        std::map<std::string, bool> children; // name -> isDirectory
        const auto prefix = dir.empty() ? std::string{} : dir + "/";
        const auto collect = [&](const std::string& p, const bool isDir) {
            if (p.empty() || !p.starts_with(prefix) || parentOf(p) != dir) return;
            children.emplace(p.substr(prefix.size()), isDir);
        };
        for (const auto& d : dirs_) collect(d, true);
        for (const auto& [p, _] : files_) collect(p, false);

        for (const auto& [name, isDir] : children) {
            const auto full = prefix + name;
            if (fn(fs::path(full), isDir) == WalkAction::SkipSubtree || !isDir) continue;
            self(self, full);
        }
    };

    walkDir(walkDir, start);
}
