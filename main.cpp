// Model
#include "model/manifest.hpp"

// Help
#include "cli/HelpCommand.hpp"
#include "help/OutputSink.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

#include <string>
#include <vector>

#include <fmt/format.h>

using namespace hl::cli;
using namespace hl::config;
using namespace hl::help;
using namespace hl::model;
using namespace hl::logging;

namespace {

constexpr auto* USAGE = "usage: hl-help <manifest.yaml> [subcommand ...] [--config <config.yaml>]\n";

}

int main(const int argc, char** argv) {
    const auto inv = parseInvocation(std::vector<std::string>(argv + 1, argv + argc));
    if (!inv) {
        fmt::print(stderr, "{}", USAGE);
        return EXIT_USAGE;
    }

    try {
        if (inv->config) ConfigRegistry::init(*inv->config);
        else ConfigRegistry::initDefaults();
        LogRegistry::init(ConfigRegistry::get().logging);

        const auto root = loadManifest(inv->manifest);
        StderrSink sink;
        return writeHelp(root, inv->path, ConfigRegistry::get().layout.toLayout(), sink);
    } catch (const std::exception& e) {
        fmt::print(stderr, "hl-help: {}\n", e.what());
        return EXIT_ERROR;
    }
}
