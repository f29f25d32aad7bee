#pragma once

#include "model/Arg.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hl::model {

class Command {
public:
    enum class Property : uint8_t {
        PositionalArgRequired = 1 << 0,
        SubcommandRequired    = 1 << 1,
    };

    std::string name;
    std::optional<std::string> description;

    Command() = default;
    explicit Command(std::string name_, std::optional<std::string> description_ = std::nullopt)
        : name(std::move(name_)), description(std::move(description_)) {}

    // Routes the arg to options or positional args depending on whether it has a short/long name.
    void addArg(Arg arg);
    void addArgs(std::vector<Arg> args);
    void addSubcommand(Command subcommand);

    [[nodiscard]] bool hasProperty(Property p) const { return (properties_ & static_cast<uint8_t>(p)) != 0; }
    void setProperty(const Property p) { properties_ |= static_cast<uint8_t>(p); }

    [[nodiscard]] std::size_t countPositionalArgs() const { return positional_args_.size(); }
    [[nodiscard]] std::size_t countOptions() const { return options_.size(); }
    [[nodiscard]] std::size_t countSubcommands() const { return subcommands_.size(); }

    [[nodiscard]] const std::vector<Arg>& positionalArgs() const { return positional_args_; }
    [[nodiscard]] const std::vector<Arg>& options() const { return options_; }
    [[nodiscard]] const std::vector<Command>& subcommands() const { return subcommands_; }

    [[nodiscard]] const Command* findSubcommand(const std::string& name) const;

private:
    std::vector<Arg> positional_args_;
    std::vector<Arg> options_;
    std::vector<Command> subcommands_;
    uint8_t properties_ = 0;
};

}
