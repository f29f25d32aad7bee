#pragma once

#include <cstdio>
#include <cstddef>
#include <string>
#include <string_view>

namespace hl::help {

struct OutputSink {
    virtual ~OutputSink() = default;
    virtual void write(std::string_view s) = 0;
    virtual void flush() = 0;
};

// Writes to a C stream, stderr unless told otherwise. Does not own the stream.
class StderrSink final : public OutputSink {
public:
    explicit StderrSink(std::FILE* stream = stderr);
    void write(std::string_view s) override;
    void flush() override;

private:
    std::FILE* stream_;
};

class StringSink final : public OutputSink {
public:
    void write(std::string_view s) override;
    void flush() override { ++flushes_; }

    [[nodiscard]] const std::string& str() const { return buffer_; }
    [[nodiscard]] std::size_t writes() const { return writes_; }
    [[nodiscard]] std::size_t flushes() const { return flushes_; }

private:
    std::string buffer_;
    std::size_t writes_ = 0, flushes_ = 0;
};

}
