#include "help/OutputSink.hpp"
#include "help/errors.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fmt/format.h>

using namespace hl::help;

StderrSink::StderrSink(std::FILE* stream) : stream_(stream) {
    if (!stream_) throw std::invalid_argument("[StderrSink] Null stream");
}

void StderrSink::write(const std::string_view s) {
    try {
        fmt::print(stream_, "{}", s);
    } catch (const std::system_error& e) {
        throw OutputWriteFailure(fmt::format("[StderrSink] Write failed: {}", e.what()));
    }
}

void StderrSink::flush() {
    if (std::fflush(stream_) != 0)
        throw OutputWriteFailure(fmt::format("[StderrSink] Flush failed: {}", std::strerror(errno)));
}

void StringSink::write(const std::string_view s) {
    buffer_.append(s);
    ++writes_;
}
