#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace hl::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    config_ = loadConfig(path);
    initialized_ = true;
}

void ConfigRegistry::initDefaults() {
    config_ = Config{};
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

} // namespace hl::config
