#pragma once

#include "storage/StorageEngine.hpp"

#include <map>
#include <set>
#include <string>

namespace sp::storage {

// Deterministic in-memory tree, mainly for tests.
class MemoryStorageEngine : public StorageEngine {
public:
    MemoryStorageEngine() = default;
    ~MemoryStorageEngine() override = default;

    [[nodiscard]] std::optional<std::vector<uint8_t>> readFile(const fs::path& relPath) const override;
    void writeFile(const fs::path& relPath, const std::vector<uint8_t>& data) override;
    bool deleteFile(const fs::path& relPath) override;
    void mkdirs(const fs::path& relPath) override;
    [[nodiscard]] bool exists(const fs::path& relPath) const override;
    [[nodiscard]] bool isDirectory(const fs::path& relPath) const override;
    void walk(const fs::path& root, const WalkFn& fn) const override;

    [[nodiscard]] StorageType type() const override { return StorageType::Memory; }

    [[nodiscard]] size_t fileCount() const { return files_.size(); }

private:
    std::map<std::string, std::vector<uint8_t>> files_;
    std::set<std::string> dirs_;
};

}
