#include "help/ContentBlock.hpp"
#include "help/errors.hpp"

#include <algorithm>

using namespace hl::help;

ContentBlock::ContentBlock(const std::size_t width, const bool fill)
    : width_(width), fill_(fill) {
    visible_.reserve(width_);
}

void ContentBlock::appendPadding(const std::size_t n) {
    visible_.append(std::min(n, remaining()), WHITE_SPACE);
}

void ContentBlock::append(const std::string_view text) {
    const auto room = remaining();
    if (text.size() <= room) {
        visible_.append(text);
        return;
    }

    const auto excess = text.substr(room);
    if (overflow_.size() + excess.size() > width_)
        throw CapacityViolation(fmt::format(
            "[ContentBlock] {} bytes do not fit a {} byte block ({} visible, {} already overflowed)",
            text.size(), width_, visible_.size(), overflow_.size()));

    visible_.append(text.substr(0, room));
    overflow_.append(excess);
}

std::string ContentBlock::format() const {
    std::string out;
    formatTo(out);
    return out;
}

void ContentBlock::formatTo(std::string& out) const {
    out.append(visible_);
    if (fill_ && visible_.size() < width_) out.append(width_ - visible_.size(), WHITE_SPACE);
}

std::optional<std::string_view> ContentBlock::overflow() const {
    if (overflow_.empty()) return std::nullopt;
    return std::string_view(overflow_);
}
