#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace YAML {

using namespace hl::config;

// spdlog::level::from_str maps anything unknown to "off", which would hide typos
static spdlog::level::level_enum parseLevel(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    const auto str = node.as<std::string>();
    const auto lvl = spdlog::level::from_str(str);
    if (lvl == spdlog::level::off && str != "off")
        throw std::runtime_error("[Config] Unknown log level '" + str + "'");
    return lvl;
}

template<>
struct convert<LayoutConfig> {
    static bool decode(const Node& node, LayoutConfig& rhs) {
        if (!node.IsMap()) return false;
        const LayoutConfig def;
        rhs.signature_width = node["signature_width"].as<std::size_t>(def.signature_width);
        rhs.description_width = node["description_width"].as<std::size_t>(def.description_width);
        rhs.signature_padding = node["signature_padding"].as<std::size_t>(def.signature_padding);
        rhs.values_indent = node["values_indent"].as<std::size_t>(def.values_indent);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig def;
        rhs.helpline = parseLevel(node["helpline"], def.helpline);
        rhs.render   = parseLevel(node["render"], def.render);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = parseLevel(node["console_log_level"], LoggingConfig{}.console_log_level);
        if (const auto levels = node["subsystem_levels"]) rhs.subsystem_levels = levels.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

}
