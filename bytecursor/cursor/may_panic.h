#ifndef MAY_PANIC_H
#define MAY_PANIC_H

#include <span>

#include "bytes.h"
#include "reader.h"

namespace reader {

/**
 * Borrows a Reader to satisfy buffer::Buf.
 *
 * copy_to_bytes() throws std::bad_expected_access<reader::Error> when fewer
 * bytes remain than requested, so using this wrapper forfeits the reader's
 * no-throw guarantee. Check has_remaining() first where that matters.
 */
class MayPanic {
private:
    Reader& reader_;
public:
    explicit MayPanic(Reader&) noexcept;

    auto get() noexcept -> Reader&;
    auto get() const noexcept -> const Reader&;

    auto remaining() const noexcept -> size_t;
    auto has_remaining(size_t) const noexcept -> bool;
    auto chunk() const noexcept -> std::span<const std::byte>;
    auto advance(size_t) noexcept -> void;
    auto copy_to_bytes(size_t) -> bytes::Bytes;
};

}

#endif // MAY_PANIC_H
