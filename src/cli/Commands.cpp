#include "cli/Commands.hpp"
#include "cli/Table.hpp"
#include "repo/Repository.hpp"
#include "repo/Layout.hpp"
#include "storage/LocalDiskStorageEngine.hpp"
#include "config/ConfigRegistry.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <cstddef>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <stdexcept>

using namespace sp::config;
using namespace sp::repo;
using namespace sp::log;

namespace sp::cli {

namespace {

struct Context {
    std::vector<std::string> args;   // command arguments, command name excluded
    std::ostream& out;
    std::ostream& err;
    std::filesystem::path root;
    std::unique_ptr<Repository> repo;
};

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Command {
    std::string synopsis;
    std::string description;
    std::function<int(Context&)> handler;
};

std::string joinArgs(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

void printSummary(std::ostream& out, const checkout::model::Summary& s) {
    fmt::print(out, "Checked out {}: {} written, {} deleted, {} ignored kept{}\n",
               s.save_id, s.written, s.deleted, s.preserved,
               s.ignore_file_restored ? std::string(", ") + std::string(IGNORE_FILE) + " restored" : "");
}

int cmdInit(Context& ctx) {
    if (!ctx.args.empty()) throw UsageError("init takes no arguments");
    ctx.repo->initRepository();
    fmt::print(ctx.out, "Initialized empty savepoint repository in {}\n", (ctx.root / META_DIR).string());
    return 0;
}

int cmdSave(Context& ctx) {
    if (ctx.args.empty()) throw UsageError("save needs a label");
    const auto rec = ctx.repo->saveState(joinArgs(ctx.args));
    fmt::print(ctx.out, "Saved {} '{}' ({} files)\n", rec.id, rec.label, rec.files.size());
    return 0;
}

int cmdList(Context& ctx) {
    if (!ctx.args.empty()) throw UsageError("list takes no arguments");
    const auto saves = ctx.repo->listSaves();
    if (saves.empty()) {
        fmt::print(ctx.out, "No saves yet\n");
        return 0;
    }

    Table table({
        {"ID"},
        {"CREATED"},
        {"FILES", Align::Right},
        {"LABEL"}
    });
    for (const auto& s : saves)
        table.add_row({s.id, util::timestampToString(s.created_at), std::to_string(s.files.size()), s.label});

    fmt::print(ctx.out, "{}", table.render());
    return 0;
}

int cmdCheckout(Context& ctx) {
    if (ctx.args.size() != 1) throw UsageError("checkout needs exactly one save id");
    printSummary(ctx.out, ctx.repo->checkout(ctx.args.front()));
    return 0;
}

int cmdNow(Context& ctx) {
    if (!ctx.args.empty()) throw UsageError("now takes no arguments");
    const auto summary = ctx.repo->checkoutLatest();
    if (!summary) {
        fmt::print(ctx.out, "No saves to check out\n");
        return 0;
    }
    printSummary(ctx.out, *summary);
    return 0;
}

int cmdCheckIgnore(Context& ctx) {
    if (ctx.args.empty()) throw UsageError("check-ignore needs at least one path");
    for (const auto& [path, ignored] : ctx.repo->checkIgnore(ctx.args))
        fmt::print(ctx.out, "{}\t{}\n", ignored ? "ignored" : "tracked", path);
    return 0;
}

int cmdStats(Context& ctx) {
    if (ctx.args.size() != 1) throw UsageError("stats needs exactly one save id");
    const auto stats = ctx.repo->compressionStats(ctx.args.front());

    if (stats.files.empty()) {
        fmt::print(ctx.out, "Save {} stores no patches\n", stats.save_id);
        return 0;
    }

    Table table({
        {"PATH"},
        {"PATCH", Align::Right},
        {"COMPRESSED", Align::Right},
        {"SAVING", Align::Right}
    });
    for (const auto& f : stats.files)
        table.add_row({f.path, util::bytesToSize(f.uncompressed), util::bytesToSize(f.compressed), std::to_string(f.saving())});

    fmt::print(ctx.out, "{}", table.render());
    fmt::print(ctx.out, "Total: {} -> {} (ratio {:.3f})\n",
               util::bytesToSize(stats.total_uncompressed), util::bytesToSize(stats.total_compressed), stats.ratio());
    return 0;
}

int cmdConfig(Context& ctx) {
    if (!ctx.args.empty()) throw UsageError("config takes no arguments");
    const nlohmann::json j = ctx.repo->config();
    fmt::print(ctx.out, "{}\n", j.dump(2));
    return 0;
}

const std::map<std::string, Command>& commands() {
    static const std::map<std::string, Command> table = {
        {"init",         {"init",                "Create the .savepoint directory in the working tree", cmdInit}},
        {"save",         {"save <label...>",     "Record the current tracked files as a new save", cmdSave}},
        {"list",         {"list",                "List saves, oldest first", cmdList}},
        {"checkout",     {"checkout <id>",       "Restore the working tree to a save, keeping ignored files", cmdCheckout}},
        {"now",          {"now",                 "Check out the most recent save", cmdNow}},
        {"check-ignore", {"check-ignore <path...>", "Show whether paths are ignored", cmdCheckIgnore}},
        {"stats",        {"stats <id>",          "Patch compression statistics for a save", cmdStats}},
        {"config",       {"config",              "Print the effective configuration as JSON", cmdConfig}},
    };
    return table;
}

}

std::string usage() {
    std::string out = "usage: savepoint [-C <dir>] <command> [args...]\n\ncommands:\n";
    for (const auto& [_, cmd] : commands())
        out += fmt::format("  {:<24}{}\n", cmd.synopsis, cmd.description);
    return out;
}

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    std::filesystem::path root = std::filesystem::current_path();
    size_t i = 0;

    if (i < args.size() && args[i] == "-C") {
        if (i + 1 >= args.size()) {
            fmt::print(err, "error: -C needs a directory\n{}", usage());
            return 1;
        }
        root = args[i + 1];
        i += 2;
    }

    if (i >= args.size()) {
        fmt::print(err, "{}", usage());
        return 1;
    }

    const auto& name = args[i];
    if (name == "help" || name == "--help" || name == "-h") {
        fmt::print(out, "{}", usage());
        return 0;
    }

    const auto it = commands().find(name);
    if (it == commands().end()) {
        fmt::print(err, "error: unknown command '{}'\n{}", name, usage());
        return 1;
    }

    try {
        const auto metaDir = root / META_DIR;
        ConfigRegistry::init(root / CONFIG_FILE);

        if (!Registry::isInitialized()) {
            std::optional<std::filesystem::path> logDir;
            if (std::filesystem::is_directory(metaDir)) logDir = root / LOG_DIR;
            Registry::init(ConfigRegistry::get().logging, logDir);
        }
        Registry::config()->debug("[cli] Using configuration from {}", (root / CONFIG_FILE).string());

        Context ctx{
            {args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end()},
            out,
            err,
            root,
            std::make_unique<Repository>(std::make_shared<storage::LocalDiskStorageEngine>(root), ConfigRegistry::get())
        };

        return it->second.handler(ctx);
    } catch (const UsageError& e) {
        fmt::print(err, "error: {}\nusage: savepoint {}\n", e.what(), it->second.synopsis);
    } catch (const error::Error& e) {
        if (Registry::isInitialized()) Registry::savepoint()->debug("[cli] {} failed ({})", name, error::to_string(e.kind()));
        fmt::print(err, "error: {}\n", e.what());
    } catch (const std::exception& e) {
        fmt::print(err, "unexpected error: {}\n", e.what());
    }

    return 1;
}

}
