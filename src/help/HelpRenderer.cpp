#include "help/HelpRenderer.hpp"
#include "help/errors.hpp"
#include "help/policy.hpp"
#include "logging/LogRegistry.hpp"

#include <iterator>

#include <fmt/format.h>

using namespace hl::help;
using namespace hl::model;
using namespace hl::logging;

namespace {

// The core renders without the ambient stack too.
std::shared_ptr<spdlog::logger> renderLog() {
    return LogRegistry::isInitialized() ? LogRegistry::render() : nullptr;
}

}

HelpRenderer::HelpRenderer(const Command& command, const Layout& layout)
    : command_(command), layout_(layout) {
    layout_.validate();
}

std::string HelpRenderer::render() const {
    std::string out;
    renderTo_(out);
    return out;
}

void HelpRenderer::write(OutputSink& sink) const {
    std::string out;
    renderTo_(out);

    try {
        sink.write(out);
        sink.flush();
    } catch (const OutputWriteFailure& e) {
        if (const auto log = renderLog()) log->error("[HelpRenderer] [write] '{}': {}", command_.name, e.what());
        throw;
    }
}

void HelpRenderer::renderTo_(std::string& out) const {
    if (const auto log = renderLog())
        log->debug("[HelpRenderer] Rendering '{}': {} args, {} commands, {} options",
                   command_.name, command_.countPositionalArgs(), command_.countSubcommands(), command_.countOptions());

    try {
        writeDescription_(out);
        writeHeader_(out);
        writePositionalArgs_(out);
        writeSubcommands_(out);
        writeOptions_(out);
        writeFooter_(out);
    } catch (const CapacityViolation& e) {
        if (const auto log = renderLog()) log->error("[HelpRenderer] '{}': {}", command_.name, e.what());
        throw;
    }
}

void HelpRenderer::writeDescription_(std::string& out) const {
    if (command_.description) fmt::format_to(std::back_inserter(out), "{}\n\n", *command_.description);
}

void HelpRenderer::writeHeader_(std::string& out) const {
    fmt::format_to(std::back_inserter(out), "Usage: {}", command_.name);

    if (command_.countPositionalArgs() >= 1)
        out += " " + bracketed("ARGS", command_.hasProperty(Command::Property::PositionalArgRequired));

    if (command_.countOptions() >= 1) out += " [OPTIONS]";

    if (command_.countSubcommands() >= 1)
        out += " " + bracketed("COMMAND", command_.hasProperty(Command::Property::SubcommandRequired));

    out.push_back('\n');
}

void HelpRenderer::writePositionalArgs_(std::string& out) const {
    if (command_.countPositionalArgs() == 0) return;

    out += "\nArgs:\n";

    for (const auto& arg : command_.positionalArgs()) {
        auto line = newLine_();
        line.signature.appendPadding(layout_.signature_padding);
        line.signature.append(arg.name);

        if (arg.hasProperty(Arg::Property::TakesMultipleValues)) line.signature.append("...");

        if (arg.description) line.description.append(*arg.description);

        line.formatTo(out);
    }
}

void HelpRenderer::writeSubcommands_(std::string& out) const {
    if (command_.countSubcommands() == 0) return;

    out += "\nCommands:\n";

    for (const auto& subcommand : command_.subcommands()) {
        auto line = newLine_();
        line.signature.appendPadding(layout_.signature_padding);
        line.signature.append(subcommand.name);

        if (subcommand.description) line.description.append(*subcommand.description);

        line.formatTo(out);
    }
}

void HelpRenderer::writeOptions_(std::string& out) const {
    if (command_.countOptions() == 0) return;

    out += "\nOptions:\n";

    for (const auto& option : command_.options()) writeOption_(out, option);

    const auto help = Arg::booleanOption("help", 'h', std::string(HELP_DESCRIPTION));
    writeOption_(out, help);
}

void HelpRenderer::writeOption_(std::string& out, const Arg& option) const {
    auto line = newLine_();
    line.signature.appendPadding(layout_.signature_padding);

    //     -t, --time
    //         --max-time
    line.signature.append(optionSignature(option, layout_.signature_padding));

    if (option.description) {
        line.description.append(*option.description);
        line.formatTo(out);
    }

    if (option.valid_values) {
        if (!option.description) {
            line.description.append(formatValues(*option.valid_values));
            line.formatTo(out);
            return;
        }

        // Second row right below the description.
        auto valuesLine = newLine_();
        valuesLine.description.appendPadding(layout_.values_indent);
        valuesLine.description.append(formatValues(*option.valid_values));
        valuesLine.formatTo(out);
        return;
    }

    // TODO: product review on whether a bare option should still get a signature-only row.
    if (!option.description) {
        if (const auto log = renderLog())
            log->debug("[HelpRenderer] [writeOption] '{}': option '{}' has neither description nor values, no row",
                       command_.name, option.name);
    }
}

void HelpRenderer::writeFooter_(std::string& out) const {
    if (command_.countSubcommands() >= 1)
        fmt::format_to(std::back_inserter(out),
                       "\nRun '{} <command>' with '-h/--help' flag to get help of any command.\n",
                       command_.name);
}
