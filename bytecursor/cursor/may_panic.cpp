#include "buffer.h"
#include "may_panic.h"

static_assert(buffer::Buf<reader::MayPanic>);

auto reader::Reader::may_panic() noexcept -> reader::MayPanic {
    return reader::MayPanic{*this};
}

reader::MayPanic::MayPanic(reader::Reader& reader) noexcept : reader_(reader) {}

auto reader::MayPanic::get() noexcept -> reader::Reader& {
    return reader_;
}

auto reader::MayPanic::get() const noexcept -> const reader::Reader& {
    return reader_;
}

auto reader::MayPanic::remaining() const noexcept -> size_t {
    return reader_.remaining();
}

auto reader::MayPanic::has_remaining(size_t count) const noexcept -> bool {
    return reader_.has_remaining(count);
}

auto reader::MayPanic::chunk() const noexcept -> std::span<const std::byte> {
    return reader_.inner_.view().subspan(reader_.position_);
}

auto reader::MayPanic::advance(size_t count) noexcept -> void {
    reader_.increment(count);
}

auto reader::MayPanic::copy_to_bytes(size_t count) -> bytes::Bytes {
    return reader_.read_bytes(count).value();
}
