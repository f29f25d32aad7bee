#include "model/manifest.hpp"
#include "model/manifest_yaml.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace hl::logging;

namespace hl::model {

namespace {

Command fromRoot(const YAML::Node& root) {
    if (!root || !root.IsMap()) throw std::runtime_error("[Manifest] Top level node must be a map");
    auto command = root.as<Command>();

    if (const auto log = LogRegistry::tryGet("helpline"))
        log->debug("[Manifest] Loaded '{}': {} args, {} options, {} commands", command.name,
                   command.countPositionalArgs(), command.countOptions(), command.countSubcommands());
    return command;
}

}

Command loadManifest(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("[Manifest] Manifest file not found: " + path.string());
    return fromRoot(YAML::LoadFile(path.string()));
}

Command parseManifest(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

}
