#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace hl::help {

/// Fixed width cell of a help Line.
///
/// Text is appended to the visible part until it holds exactly width() bytes,
/// everything past that lands in the overflow part which has the same capacity.
/// Overflow is a single level: content that does not fit in visible + overflow
/// is rejected with CapacityViolation rather than cut.
class ContentBlock {
public:
    static constexpr char WHITE_SPACE = ' ';

    ContentBlock(std::size_t width, bool fill);

    /// Appends up to n spaces, saturating at the remaining capacity.
    void appendPadding(std::size_t n);

    /// Appends text, spilling what does not fit into the overflow part.
    /// @throws CapacityViolation when the overflow part would exceed width().
    void append(std::string_view text);

    template <typename... Args>
    void print(fmt::format_string<Args...> format_str, Args&&... args) {
        append(fmt::format(format_str, std::forward<Args>(args)...));
    }

    /// Visible bytes, padded to width() when the block fills.
    [[nodiscard]] std::string format() const;
    void formatTo(std::string& out) const;

    /// Content that could not fit, if any.
    [[nodiscard]] std::optional<std::string_view> overflow() const;

    [[nodiscard]] std::string_view visible() const { return visible_; }
    [[nodiscard]] std::size_t width() const { return width_; }
    [[nodiscard]] std::size_t remaining() const { return width_ - visible_.size(); }

private:
    std::size_t width_;
    bool fill_;
    std::string visible_;
    std::string overflow_;
};

}
