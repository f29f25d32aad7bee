#pragma once

#include "help/Layout.hpp"
#include "help/OutputSink.hpp"
#include "model/Command.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hl::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_USAGE = 2;

struct Invocation {
    std::string manifest;
    std::vector<std::string> path;      // subcommand names below the manifest root
    std::optional<std::string> config;
};

// Arguments without the program name. nullopt when the invocation is not usable
// (no manifest, dangling --config, -h/--help).
std::optional<Invocation> parseInvocation(const std::vector<std::string>& args);

// nullptr when a name on the path is not a subcommand of its parent.
const model::Command* resolvePath(const model::Command& root, const std::vector<std::string>& path);

// Writes the help of the command at `path`, or a one-line error followed by the
// root help when the path does not resolve.
// @returns EXIT_OK or EXIT_USAGE
// @throws help::CapacityViolation, help::OutputWriteFailure
int writeHelp(const model::Command& root,
              const std::vector<std::string>& path,
              const help::Layout& layout,
              help::OutputSink& sink);

}
