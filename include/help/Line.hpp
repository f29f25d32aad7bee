#pragma once

#include "help/ContentBlock.hpp"
#include "help/Layout.hpp"

#include <string>

namespace hl::help {

/// A terminal row made of two blocks: the space filled `signature` on the
/// left and the ragged `description` on the right.
///
/// Formatting a line also formats the continuation lines carrying whatever
/// either block could not fit, until nothing is left over.
class Line {
public:
    explicit Line(const Layout& layout = {});

    ContentBlock signature;
    ContentBlock description;

    [[nodiscard]] std::string format() const;
    void formatTo(std::string& out) const;

    [[nodiscard]] bool overflowed() const;

private:
    Layout layout_;
};

}
