#pragma once

#include "model/Arg.hpp"
#include "model/Command.hpp"

#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

#include <stdexcept>
#include <string>

namespace YAML {

using namespace hl::model;

static std::runtime_error manifestError(const Node& node, const std::string& what) {
    return std::runtime_error(fmt::format("[Manifest] line {}: {}", node.Mark().line + 1, what));
}

static std::string requiredName(const Node& node, const std::string& kind) {
    const auto name = node["name"];
    if (!name || !name.IsScalar()) throw manifestError(node, kind + " without 'name'");
    return name.as<std::string>();
}

template<>
struct convert<Arg> {
    static bool decode(const Node& node, Arg& rhs) {
        if (!node.IsMap()) return false;

        rhs = Arg(requiredName(node, "arg"));

        if (const auto s = node["short"]) {
            const auto str = s.as<std::string>();
            if (str.size() != 1) throw manifestError(s, fmt::format("'{}': short name must be one character, got '{}'", rhs.name, str));
            rhs.short_name = str.front();
        }
        if (const auto l = node["long"]) rhs.long_name = l.as<std::string>();
        if (const auto d = node["description"]) rhs.description = d.as<std::string>();
        if (const auto v = node["value_name"]) rhs.value_placeholder = v.as<std::string>();

        if (const auto values = node["values"]) {
            if (!values.IsSequence()) throw manifestError(values, fmt::format("'{}': 'values' must be a list", rhs.name));
            rhs.valid_values = values.as<std::vector<std::string>>();
        }

        if (node["takes_value"].as<bool>(false)) rhs.setProperty(Arg::Property::TakesValue);
        if (node["multiple"].as<bool>(false)) rhs.setProperty(Arg::Property::TakesMultipleValues);
        if (node["required"].as<bool>(false)) rhs.setProperty(Arg::Property::Required);
        return true;
    }
};

template<>
struct convert<Command> {
    static bool decode(const Node& node, Command& rhs) {
        if (!node.IsMap()) return false;

        rhs = Command(requiredName(node, "command"));
        if (const auto d = node["description"]) rhs.description = d.as<std::string>();
        if (node["subcommand_required"].as<bool>(false)) rhs.setProperty(Command::Property::SubcommandRequired);

        for (const auto& child : list(node, "args")) {
            auto arg = child.as<Arg>();
            if (arg.isOption()) throw manifestError(child, fmt::format("'{}': positional args take no short/long name", arg.name));
            rhs.addArg(std::move(arg));
        }

        for (const auto& child : list(node, "options")) {
            auto option = child.as<Arg>();
            if (!option.isOption()) throw manifestError(child, fmt::format("'{}': options need a short or long name", option.name));
            rhs.addArg(std::move(option));
        }

        for (const auto& child : list(node, "commands")) rhs.addSubcommand(child.as<Command>());

        return true;
    }

private:
    static Node list(const Node& node, const std::string& key) {
        const auto seq = node[key];
        if (!seq) return Node(NodeType::Sequence);
        if (!seq.IsSequence()) throw manifestError(seq, fmt::format("'{}' must be a list", key));
        return seq;
    }
};

}
