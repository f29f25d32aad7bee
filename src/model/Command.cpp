#include "model/Command.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

using namespace hl::model;

void Command::addArg(Arg arg) {
    if (!arg.isOption()) {
        if (arg.hasProperty(Arg::Property::Required)) setProperty(Property::PositionalArgRequired);
        positional_args_.push_back(std::move(arg));
        return;
    }

    const auto clash = std::ranges::find_if(options_, [&](const Arg& o) {
        return (arg.short_name && o.short_name == arg.short_name) ||
               (arg.long_name && o.long_name == arg.long_name);
    });
    if (clash != options_.end())
        throw std::invalid_argument(fmt::format("[Command] '{}': option '{}' clashes with option '{}'",
                                                name, arg.name, clash->name));

    options_.push_back(std::move(arg));
}

void Command::addArgs(std::vector<Arg> args) {
    for (auto& a : args) addArg(std::move(a));
}

void Command::addSubcommand(Command subcommand) {
    if (findSubcommand(subcommand.name))
        throw std::invalid_argument(fmt::format("[Command] '{}': duplicate subcommand '{}'", name, subcommand.name));
    subcommands_.push_back(std::move(subcommand));
}

const Command* Command::findSubcommand(const std::string& name) const {
    const auto it = std::ranges::find_if(subcommands_, [&](const Command& c) { return c.name == name; });
    return it == subcommands_.end() ? nullptr : &*it;
}
