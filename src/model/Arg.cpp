#include "model/Arg.hpp"

using namespace hl::model;

Arg Arg::positional(std::string name, std::optional<std::string> description) {
    return Arg(std::move(name), std::move(description));
}

Arg Arg::booleanOption(const std::string& name,
                       const std::optional<char> shortName,
                       std::optional<std::string> description) {
    Arg a(name, std::move(description));
    a.short_name = shortName;
    a.long_name = name;
    return a;
}

Arg Arg::singleValueOption(const std::string& name,
                           const std::optional<char> shortName,
                           std::optional<std::string> description) {
    auto a = booleanOption(name, shortName, std::move(description));
    a.setProperty(Property::TakesValue);
    return a;
}

Arg Arg::multiValuesOption(const std::string& name,
                           const std::optional<char> shortName,
                           std::optional<std::string> description) {
    auto a = booleanOption(name, shortName, std::move(description));
    a.setProperty(Property::TakesMultipleValues);
    return a;
}

void Arg::setProperty(const Property p) {
    properties_ |= static_cast<uint8_t>(p);
    // multiple values without a value makes no sense
    if (p == Property::TakesMultipleValues) properties_ |= static_cast<uint8_t>(Property::TakesValue);
}
