#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hl::model {

class Arg {
public:
    enum class Property : uint8_t {
        TakesValue          = 1 << 0,
        TakesMultipleValues = 1 << 1,
        Required            = 1 << 2,
    };

    std::string name;
    std::optional<char> short_name;
    std::optional<std::string> long_name;
    std::optional<std::string> description;
    std::optional<std::string> value_placeholder;   // shown as =<value_placeholder>, falls back to name
    std::optional<std::vector<std::string>> valid_values;

    Arg() = default;
    explicit Arg(std::string name_, std::optional<std::string> description_ = std::nullopt)
        : name(std::move(name_)), description(std::move(description_)) {}

    // 🏗️ Factory Methods

    static Arg positional(std::string name, std::optional<std::string> description = std::nullopt);

    // Flag style option with long name == name.
    static Arg booleanOption(const std::string& name,
                             std::optional<char> shortName,
                             std::optional<std::string> description = std::nullopt);

    static Arg singleValueOption(const std::string& name,
                                 std::optional<char> shortName,
                                 std::optional<std::string> description = std::nullopt);

    static Arg multiValuesOption(const std::string& name,
                                 std::optional<char> shortName,
                                 std::optional<std::string> description = std::nullopt);

    [[nodiscard]] bool hasProperty(Property p) const { return (properties_ & static_cast<uint8_t>(p)) != 0; }
    void setProperty(Property p);
    void unsetProperty(Property p) { properties_ &= static_cast<uint8_t>(~static_cast<uint8_t>(p)); }

    // An arg is an option when it has a short or long name, positional otherwise.
    [[nodiscard]] bool isOption() const { return short_name.has_value() || long_name.has_value(); }

private:
    uint8_t properties_ = 0;
};

}
