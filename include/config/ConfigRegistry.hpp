#pragma once

#include "config/Config.hpp"

#include <filesystem>

namespace hl::config {

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path);
    static void initDefaults();
    static const Config& get();

    [[nodiscard]] static bool isInitialized() { return initialized_; }

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
};

} // namespace hl::config
