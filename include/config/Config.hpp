#pragma once

#include "help/Layout.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace hl::config {

struct LayoutConfig {
    std::size_t signature_width = 50;
    std::size_t description_width = 500;
    std::size_t signature_padding = 4;
    std::size_t values_indent = 2;

    [[nodiscard]] help::Layout toLayout() const;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum helpline = spdlog::level::info;   // Startup, manifest loading
    spdlog::level::level_enum render   = spdlog::level::warn;   // Section counts and dropped rows at debug
};

struct LoggingConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    LayoutConfig layout;
    LoggingConfig logging;

    // @throws std::invalid_argument
    void validate() const;
};

// Missing sections and keys keep their defaults.
// @throws YAML::Exception, std::runtime_error, std::invalid_argument
Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);

}
