#pragma once

#include <stdexcept>

namespace hl::help {

// A single write would need more than one overflow level of a ContentBlock.
struct CapacityViolation : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The output sink rejected a write or flush.
struct OutputWriteFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
