#include "help/policy.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace hl::help {

std::pair<char, char> braces(const bool required) {
    return required ? std::pair{'<', '>'} : std::pair{'[', ']'};
}

std::string bracketed(const std::string& word, const bool required) {
    const auto [open, close] = braces(required);
    return fmt::format("{}{}{}", open, word, close);
}

std::size_t longNameIndent(const bool hasShortName, const bool hasLongName, const std::size_t indent) {
    return !hasShortName && hasLongName ? indent : 0;
}

std::string optionNames(const model::Arg& option) {
    if (option.short_name && option.long_name) return fmt::format("-{}, --{}", *option.short_name, *option.long_name);
    if (option.short_name) return fmt::format("-{}", *option.short_name);
    if (option.long_name) return fmt::format("--{}", *option.long_name);
    return {};
}

std::string valueSuffix(const model::Arg& option) {
    using Property = model::Arg::Property;
    if (!option.hasProperty(Property::TakesValue)) return {};

    const auto& valueName = option.value_placeholder ? *option.value_placeholder : option.name;
    return fmt::format("=<{}>{}", valueName, option.hasProperty(Property::TakesMultipleValues) ? "..." : "");
}

std::string optionSignature(const model::Arg& option, const std::size_t indent) {
    std::string signature(longNameIndent(option.short_name.has_value(), option.long_name.has_value(), indent), ' ');
    signature += optionNames(option);
    signature += valueSuffix(option);
    return signature;
}

std::string formatValues(const std::vector<std::string>& values) {
    return fmt::format("values: {}", fmt::join(values, ", "));
}

}
