#ifndef STREAM_H
#define STREAM_H

#include <span>
#include <streambuf>

#include "reader.h"

namespace reader {

// Copies min(remaining, destination.size()) bytes and returns that count, 0
// once the reader is exhausted.
auto read_into(Reader&, std::span<std::byte> destination) noexcept -> size_t;

/**
 * Exposes a borrowed Reader as a read-only std::streambuf, so that
 * std::istream based code can consume it. Reads through the stream advance
 * the reader.
 */
class StreamBuf : public std::streambuf {
private:
    Reader& reader_;
public:
    explicit StreamBuf(Reader&) noexcept;
protected:
    auto showmanyc() -> std::streamsize override;
    auto underflow() -> int_type override;
    auto uflow() -> int_type override;
    auto xsgetn(char_type*, std::streamsize) -> std::streamsize override;
};

}

#endif // STREAM_H
