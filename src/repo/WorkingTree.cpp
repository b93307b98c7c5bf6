#include "repo/WorkingTree.hpp"
#include "repo/Layout.hpp"
#include "storage/StorageEngine.hpp"
#include "util/bytes.hpp"

#include <algorithm>

using namespace sp::storage;

namespace sp::repo {

std::vector<std::string> listWorkingFiles(const StorageEngine& engine) {
    std::vector<std::string> files;
    engine.walk({}, [&](const fs::path& rel, const bool isDirectory) {
        const auto p = rel.generic_string();
        if (isMetadataPath(p)) return WalkAction::SkipSubtree;
        if (!isDirectory) files.push_back(p);
        return WalkAction::Continue;
    });
    std::ranges::sort(files);
    return files;
}

std::vector<ignore::Pattern> loadIgnorePatterns(const StorageEngine& engine) {
    const auto raw = engine.readFile(fs::path(IGNORE_FILE));
    if (!raw) return {};
    return ignore::compile(util::asStringView(*raw));
}

std::vector<std::string> trackedFiles(const std::vector<std::string>& files,
                                      const std::vector<ignore::Pattern>& patterns) {
    std::vector<std::string> tracked;
    for (const auto& f : files)
        if (f == IGNORE_FILE || !ignore::isIgnored(f, patterns)) tracked.push_back(f);
    std::ranges::sort(tracked);
    return tracked;
}

}
