#pragma once

#include "help/Layout.hpp"
#include "help/Line.hpp"
#include "help/OutputSink.hpp"
#include "model/Command.hpp"

#include <string>
#include <string_view>

namespace hl::help {

/// Renders the help text of a command: description, usage header, positional
/// args, subcommands, options (plus the trailing -h, --help row) and footer.
///
/// The command is borrowed and must outlive the renderer.
class HelpRenderer {
public:
    static constexpr std::string_view HELP_DESCRIPTION = "Print this help and exit";

    explicit HelpRenderer(const model::Command& command, const Layout& layout = {});
    HelpRenderer(model::Command&&, const Layout& = {}) = delete;

    /// @throws CapacityViolation
    [[nodiscard]] std::string render() const;

    /// Renders into a buffer, then hands it to the sink in one write and one flush.
    /// @throws CapacityViolation, OutputWriteFailure
    void write(OutputSink& sink) const;

private:
    const model::Command& command_;
    Layout layout_;

    void renderTo_(std::string& out) const;

    void writeDescription_(std::string& out) const;
    void writeHeader_(std::string& out) const;
    void writePositionalArgs_(std::string& out) const;
    void writeSubcommands_(std::string& out) const;
    void writeOptions_(std::string& out) const;
    void writeOption_(std::string& out, const model::Arg& option) const;
    void writeFooter_(std::string& out) const;

    [[nodiscard]] Line newLine_() const { return Line(layout_); }
};

}
