#include <string>

#include "reader.h"

namespace {

class ReaderErrorCategory : public std::error_category {
public:
    auto name() const noexcept -> const char* override {
        return "reader";
    }

    auto message(int value) const -> std::string override {
        return std::string{reader::message(static_cast<reader::Error>(value))};
    }
};

}

auto reader::message(reader::Error error) noexcept -> std::string_view {
    switch (error) {
        case reader::Error::EndOfInput:
            return "end of input";
        default:
            return "unknown reader error";
    }
}

auto reader::error_category() noexcept -> const std::error_category& {
    static const ReaderErrorCategory category{};
    return category;
}

auto reader::make_error_code(reader::Error error) noexcept -> std::error_code {
    return {static_cast<int>(error), reader::error_category()};
}

reader::Reader::Reader(bytes::Bytes bytes) noexcept
    : position_(0), inner_(std::move(bytes)) {}

auto reader::Reader::increment(size_t amount) noexcept -> void {
    position_ += std::min(amount, remaining());
}

auto reader::Reader::remaining() const noexcept -> size_t {
    return inner_.size() > position_ ? inner_.size() - position_ : 0;
}

auto reader::Reader::has_remaining(size_t count) const noexcept -> bool {
    return remaining() >= count;
}

auto reader::Reader::consumed() const noexcept -> size_t {
    return position_;
}

auto reader::Reader::skip(size_t amount) noexcept -> void {
    increment(amount);
}

auto reader::Reader::peek(std::byte value) const noexcept -> bool {
    if (!has_remaining(1)) {
        return false;
    }

    return inner_.data()[position_] == value;
}

auto reader::Reader::read_byte() noexcept -> std::expected<std::byte, reader::Error> {
    if (!has_remaining(1)) {
        return std::unexpected(reader::Error::EndOfInput);
    }

    const auto result = inner_.data()[position_];
    increment(1);

    return result;
}

auto reader::Reader::read_bytes(size_t count) noexcept
        -> std::expected<bytes::Bytes, reader::Error> {
    if (!has_remaining(count)) {
        return std::unexpected(reader::Error::EndOfInput);
    }

    auto result = inner_.slice(position_, count);
    increment(count);

    return result;
}

auto reader::Reader::read_slice(size_t count) noexcept
        -> std::expected<std::span<const std::byte>, reader::Error> {
    if (!has_remaining(count)) {
        return std::unexpected(reader::Error::EndOfInput);
    }

    const auto result = inner_.view().subspan(position_, count);
    increment(count);

    return result;
}

auto reader::Reader::subreader(size_t count) noexcept
        -> std::expected<reader::Reader, reader::Error> {
    // NOTE: A zero-length sub-reader is treated as truncation, not as an
    // empty but valid reader.
    if (count == 0) {
        return std::unexpected(reader::Error::EndOfInput);
    }

    auto slice = read_bytes(count);

    if (!slice) {
        return std::unexpected(slice.error());
    }

    return reader::Reader{std::move(slice.value())};
}

auto reader::Reader::read_to_end() && noexcept -> bytes::Bytes {
    auto inner = std::move(inner_);
    const auto position = position_;

    inner_ = bytes::Bytes::empty_instance();
    position_ = 0;

    if (position == inner.size()) {
        return bytes::Bytes::empty_instance();
    }

    return inner.slice(position);
}

auto reader::Reader::read_u8() noexcept -> std::expected<uint8_t, reader::Error> {
    const auto byte = read_byte();

    if (!byte) {
        return std::unexpected(byte.error());
    }

    return std::to_integer<uint8_t>(byte.value());
}

auto reader::Reader::read_i8() noexcept -> std::expected<int8_t, reader::Error> {
    const auto value = read_u8();

    if (!value) {
        return std::unexpected(value.error());
    }

    return static_cast<int8_t>(value.value());
}

auto reader::Reader::read_u16() noexcept -> std::expected<uint16_t, reader::Error> {
    return read_big<uint16_t>();
}

auto reader::Reader::read_i16() noexcept -> std::expected<int16_t, reader::Error> {
    return read_big<int16_t>();
}

auto reader::Reader::read_u32() noexcept -> std::expected<uint32_t, reader::Error> {
    return read_big<uint32_t>();
}

auto reader::Reader::read_i32() noexcept -> std::expected<int32_t, reader::Error> {
    return read_big<int32_t>();
}

auto reader::Reader::read_u64() noexcept -> std::expected<uint64_t, reader::Error> {
    return read_big<uint64_t>();
}

auto reader::Reader::read_i64() noexcept -> std::expected<int64_t, reader::Error> {
    return read_big<int64_t>();
}

auto reader::Reader::read_u128() noexcept
        -> std::expected<endian::u128, reader::Error> {
    return read_big<endian::u128>();
}

auto reader::Reader::read_i128() noexcept
        -> std::expected<endian::i128, reader::Error> {
    return read_big<endian::i128>();
}
