#pragma once

#include "model/Arg.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace hl::help {

// '<' '>' for required, '[' ']' otherwise.
std::pair<char, char> braces(bool required);

// "<ARGS>", "[COMMAND]", ...
std::string bracketed(const std::string& word, bool required);

// Extra columns in front of "--long" when there is no "-s, " to line it up with.
std::size_t longNameIndent(bool hasShortName, bool hasLongName, std::size_t indent);

// "-s, --long", "-s" or "--long".
std::string optionNames(const model::Arg& option);

// "=<VALUE>" or "=<VALUE>..." for options taking values, empty otherwise.
std::string valueSuffix(const model::Arg& option);

// Signature text of an option after the left padding, e.g. "-t, --time=<SECS>" or "    --max-time".
std::string optionSignature(const model::Arg& option, std::size_t indent);

// "values: a, b, c"
std::string formatValues(const std::vector<std::string>& values);

}
