#include "help/Layout.hpp"

#include <stdexcept>

#include <fmt/format.h>

using namespace hl::help;

void Layout::validate() const {
    if (signature_width == 0 || description_width == 0)
        throw std::invalid_argument("[Layout] Block widths must be non-zero");

    if (signature_padding >= signature_width)
        throw std::invalid_argument(fmt::format("[Layout] signature_padding ({}) must be smaller than signature_width ({})",
                                                signature_padding, signature_width));

    if (values_indent >= description_width)
        throw std::invalid_argument(fmt::format("[Layout] values_indent ({}) must be smaller than description_width ({})",
                                                values_indent, description_width));
}
