#include "help/Line.hpp"

using namespace hl::help;

Line::Line(const Layout& layout)
    : signature(layout.signature_width, true),
      description(layout.description_width, false),
      layout_(layout) {}

bool Line::overflowed() const {
    return signature.overflow().has_value() || description.overflow().has_value();
}

std::string Line::format() const {
    std::string out;
    formatTo(out);
    return out;
}

void Line::formatTo(std::string& out) const {
    signature.formatTo(out);
    description.formatTo(out);
    out.push_back('\n');

    const auto overflowSignature = signature.overflow();
    const auto overflowDescription = description.overflow();
    if (!overflowSignature && !overflowDescription) return;

    // Keeps the continuation signature aligned with this one.
    Line next(layout_);
    next.signature.appendPadding(layout_.signature_padding);
    if (overflowSignature) next.signature.append(*overflowSignature);
    if (overflowDescription) next.description.append(*overflowDescription);

    next.formatTo(out);
}
