#pragma once

#include "config/Config.hpp"

#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace sp::log {

class Registry {
public:
    // Console sink always; rotating file sink only when logDir is set.
    static void init(const config::LoggingConfig& cnf = {},
                     const std::optional<std::filesystem::path>& logDir = std::nullopt);

    // Drops every logger so init() can run again (tests, re-opened repositories).
    static void shutdown();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> savepoint() { return get("savepoint"); }
    static std::shared_ptr<spdlog::logger> store()     { return get("store"); }
    static std::shared_ptr<spdlog::logger> delta()     { return get("delta"); }
    static std::shared_ptr<spdlog::logger> catalog()   { return get("catalog"); }
    static std::shared_ptr<spdlog::logger> checkout()  { return get("checkout"); }
    static std::shared_ptr<spdlog::logger> storage()   { return get("storage"); }
    static std::shared_ptr<spdlog::logger> config()    { return get("config"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::optional<std::filesystem::path> main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
