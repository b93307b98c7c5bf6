#pragma once

#include "storage/StorageEngine.hpp"

#include <filesystem>

namespace sp::storage {

class LocalDiskStorageEngine : public StorageEngine {
public:
    explicit LocalDiskStorageEngine(std::filesystem::path root_dir);
    ~LocalDiskStorageEngine() override = default;

    [[nodiscard]] std::optional<std::vector<uint8_t>> readFile(const fs::path& relPath) const override;
    void writeFile(const fs::path& relPath, const std::vector<uint8_t>& data) override;
    bool deleteFile(const fs::path& relPath) override;
    void mkdirs(const fs::path& relPath) override;
    [[nodiscard]] bool exists(const fs::path& relPath) const override;
    [[nodiscard]] bool isDirectory(const fs::path& relPath) const override;
    void walk(const fs::path& root, const WalkFn& fn) const override;

    [[nodiscard]] StorageType type() const override { return StorageType::Local; }

    [[nodiscard]] fs::path getAbsolutePath(const fs::path& relPath) const;
    [[nodiscard]] const fs::path& getRootPath() const { return root; }

private:
    fs::path root;

    void walkDir(const fs::path& absDir, const WalkFn& fn) const;
};

}
