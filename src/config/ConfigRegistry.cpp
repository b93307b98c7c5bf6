#include "config/ConfigRegistry.hpp"

#include <stdexcept>
#include <utility>

namespace sp::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    init(loadConfig(path));
}

void ConfigRegistry::init(Config config) {
    config.validate();
    config_ = std::move(config);
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

}
