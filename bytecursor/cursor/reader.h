#ifndef READER_H
#define READER_H

#include <algorithm>
#include <array>
#include <expected>
#include <format>
#include <span>
#include <string_view>
#include <system_error>

#include "bytes.h"
#include "endian.h"

namespace reader {

enum Error {
    EndOfInput = 1,
};

auto message(Error) noexcept -> std::string_view;
auto error_category() noexcept -> const std::error_category&;
auto make_error_code(Error) noexcept -> std::error_code;

class MayPanic;
class StreamBuf;

/**
 * Forward-only cursor over a bytes::Bytes.
 *
 * Every checked read either succeeds completely, advancing by exactly the
 * amount it returns, or fails with Error::EndOfInput without moving. None of
 * the members throw.
 */
class Reader {
private:
    size_t position_;
    bytes::Bytes inner_;

    auto increment(size_t) noexcept -> void;

    friend class MayPanic;
    friend class StreamBuf;
public:
    explicit Reader(bytes::Bytes) noexcept;

    auto remaining() const noexcept -> size_t;
    auto has_remaining(size_t) const noexcept -> bool;
    auto consumed() const noexcept -> size_t;

    // Clamped to the end of the data, never fails.
    auto skip(size_t) noexcept -> void;

    auto peek(std::byte) const noexcept -> bool;

    auto read_byte() noexcept -> std::expected<std::byte, Error>;

    auto read_bytes(size_t) noexcept -> std::expected<bytes::Bytes, Error>;

    auto read_slice(size_t) noexcept
        -> std::expected<std::span<const std::byte>, Error>;

    template <size_t N>
    auto read_array() noexcept -> std::expected<std::array<std::byte, N>, Error> {
        const auto slice = read_slice(N);

        if (!slice) {
            return std::unexpected(slice.error());
        }

        std::array<std::byte, N> array;
        std::copy_n(slice.value().begin(), N, array.begin());

        return array;
    }

    auto subreader(size_t) noexcept -> std::expected<Reader, Error>;

    // Drops the storage handle and returns the canonical empty instance when
    // nothing is left to read.
    auto read_to_end() && noexcept -> bytes::Bytes;

    auto may_panic() noexcept -> MayPanic;

    // NOTE: All multi-byte readers below are big-endian. Use decode.h for
    // other byte orders.
    auto read_u8() noexcept -> std::expected<uint8_t, Error>;
    auto read_i8() noexcept -> std::expected<int8_t, Error>;
    auto read_u16() noexcept -> std::expected<uint16_t, Error>;
    auto read_i16() noexcept -> std::expected<int16_t, Error>;
    auto read_u32() noexcept -> std::expected<uint32_t, Error>;
    auto read_i32() noexcept -> std::expected<int32_t, Error>;
    auto read_u64() noexcept -> std::expected<uint64_t, Error>;
    auto read_i64() noexcept -> std::expected<int64_t, Error>;
    auto read_u128() noexcept -> std::expected<endian::u128, Error>;
    auto read_i128() noexcept -> std::expected<endian::i128, Error>;

private:
    template <endian::MultiByteIntegral V>
    auto read_big() noexcept -> std::expected<V, Error> {
        const auto array = read_array<sizeof(V)>();

        if (!array) {
            return std::unexpected(array.error());
        }

        return endian::from_big<V>(array.value());
    }
};

}

template <>
struct std::is_error_code_enum<reader::Error> : std::true_type {};

template <>
struct std::formatter<reader::Error> : std::formatter<std::string_view> {
    auto format(reader::Error error, std::format_context& ctx) const {
        return std::formatter<std::string_view>::format(
            reader::message(error),
            ctx
        );
    }
};

#endif // READER_H
