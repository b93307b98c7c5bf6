#include "checkout/Executor.hpp"
#include "storage/StorageEngine.hpp"
#include "log/Registry.hpp"

#include <map>

using namespace sp::checkout;
using namespace sp::checkout::model;
using namespace sp::log;

static void writeWithParents(sp::storage::StorageEngine& engine, const std::string& path,
                             const std::vector<uint8_t>& content) {
    if (const auto parent = fs::path(path).parent_path(); !parent.empty()) engine.mkdirs(parent);
    // a directory left empty by the delete phase may sit where the file goes
    if (engine.isDirectory(path)) engine.deleteFile(path);
    engine.writeFile(path, content);
}

Summary Executor::run(storage::StorageEngine& engine,
                      const delta::DeltaEngine& deltas,
                      const std::string& saveId,
                      const std::vector<Action>& plan) {
    Summary summary;
    summary.save_id = saveId;

    // snapshot everything ignored before the first mutation
    std::map<std::string, std::vector<uint8_t>> preserved;
    for (const auto& a : plan) {
        if (a.type != ActionType::Preserve) continue;
        if (auto content = engine.readFile(a.path)) preserved.emplace(a.path, std::move(*content));
    }

    for (const auto& a : plan) {
        if (a.type != ActionType::Delete) continue;
        if (!engine.deleteFile(a.path)) continue;
        ++summary.deleted;
        Registry::checkout()->debug("[Executor] Deleted {}", a.path);
    }

    const delta::DeltaEngine::CacheScope scope(deltas);
    for (const auto& a : plan) {
        if (a.type != ActionType::Write) continue;
        writeWithParents(engine, a.path, deltas.resolve(a.path, saveId));
        ++summary.written;
    }

    for (const auto& [path, content] : preserved) writeWithParents(engine, path, content);
    summary.preserved = preserved.size();

    return summary;
}
