#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <stdexcept>

namespace hl::config {

namespace {

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("[Config] Top level node must be a map");

    if (auto node = root["layout"]) {
        if (!YAML::convert<LayoutConfig>::decode(node, cfg.layout))
            throw std::runtime_error("[Config] 'layout' must be a map");
    }

    if (auto node = root["logging"]) {
        if (!YAML::convert<LoggingConfig>::decode(node, cfg.logging))
            throw std::runtime_error("[Config] 'logging' must be a map");
    }

    cfg.validate();
    return cfg;
}

}

help::Layout LayoutConfig::toLayout() const {
    help::Layout layout;
    layout.signature_width = signature_width;
    layout.description_width = description_width;
    layout.signature_padding = signature_padding;
    layout.values_indent = values_indent;
    return layout;
}

void Config::validate() const {
    layout.toLayout().validate();
}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("[Config] Config file not found: " + path.string());
    return fromRoot(YAML::LoadFile(path.string()));
}

Config parseConfig(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

}
