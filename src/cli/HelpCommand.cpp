#include "cli/HelpCommand.hpp"
#include "help/HelpRenderer.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace hl::help;
using namespace hl::model;
using namespace hl::logging;

namespace hl::cli {

std::optional<Invocation> parseInvocation(const std::vector<std::string>& args) {
    Invocation inv;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--config") {
            if (++i >= args.size()) return std::nullopt;
            inv.config = args[i];
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (inv.manifest.empty()) {
            inv.manifest = arg;
        } else {
            inv.path.push_back(arg);
        }
    }
    if (inv.manifest.empty()) return std::nullopt;
    return inv;
}

const Command* resolvePath(const Command& root, const std::vector<std::string>& path) {
    const Command* command = &root;
    for (const auto& name : path) {
        command = command->findSubcommand(name);
        if (!command) return nullptr;
    }
    return command;
}

int writeHelp(const Command& root,
              const std::vector<std::string>& path,
              const Layout& layout,
              OutputSink& sink) {
    const auto* command = resolvePath(root, path);
    if (!command) {
        const auto message = fmt::format("Unknown command: {} {}", root.name, fmt::join(path, " "));
        if (const auto log = LogRegistry::tryGet("helpline")) log->error("[HelpCommand] {}", message);

        sink.write(message + "\n\n");
        HelpRenderer(root, layout).write(sink);
        return EXIT_USAGE;
    }

    if (const auto log = LogRegistry::tryGet("helpline"))
        log->debug("[HelpCommand] Rendering help for '{} {}'", root.name, fmt::join(path, " "));

    HelpRenderer(*command, layout).write(sink);
    return EXIT_OK;
}

}
