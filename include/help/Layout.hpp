#pragma once

#include <cstddef>

namespace hl::help {

struct Layout {
    std::size_t signature_width = 50;     // fixed, space filled
    std::size_t description_width = 500;  // ragged
    std::size_t signature_padding = 4;    // columns before any signature text
    std::size_t values_indent = 2;        // "values: ..." row under a described option

    // Continuation chains only drain when the re-applied padding leaves room for text.
    // @throws std::invalid_argument
    void validate() const;
};

}
