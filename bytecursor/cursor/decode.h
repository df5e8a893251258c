#ifndef DECODE_H
#define DECODE_H

#include <concepts>
#include <expected>
#include <type_traits>

#include "endian.h"
#include "may_panic.h"
#include "reader.h"

namespace decode {

inline auto as_reader(reader::Reader& reader) noexcept -> reader::Reader& {
    return reader;
}

inline auto as_reader(reader::MayPanic& wrapper) noexcept -> reader::Reader& {
    return wrapper.get();
}

// Anything that can lend out a mutable reader::Reader.
template <typename R>
concept AsReader = requires(R& source) {
    { decode::as_reader(source) } -> std::same_as<reader::Reader&>;
};

template <typename T>
concept SelfDecoding = requires(reader::Reader& reader) {
    { T::decode(reader) } -> std::same_as<std::expected<T, reader::Error>>;
};

template <typename T>
concept Decode =
    endian::SingleByteIntegral<T>
    || std::same_as<T, std::byte>
    || SelfDecoding<T>;

template <typename T>
concept DecodeEndian = endian::MultiByteIntegral<T>;

template <Decode T, AsReader R>
auto decode(R& source) -> std::expected<T, reader::Error> {
    auto& reader = decode::as_reader(source);

    if constexpr (SelfDecoding<T>) {
        return T::decode(reader);
    } else {
        const auto byte = reader.read_byte();

        if (!byte) {
            return std::unexpected(byte.error());
        }

        if constexpr (std::same_as<T, std::byte>) {
            return byte.value();
        } else {
            return static_cast<T>(std::to_integer<uint8_t>(byte.value()));
        }
    }
}

template <DecodeEndian T, AsReader R>
auto decode_le(R& source) -> std::expected<T, reader::Error> {
    const auto array = decode::as_reader(source).template read_array<sizeof(T)>();

    if (!array) {
        return std::unexpected(array.error());
    }

    return endian::from_little<T>(array.value());
}

template <DecodeEndian T, AsReader R>
auto decode_be(R& source) -> std::expected<T, reader::Error> {
    const auto array = decode::as_reader(source).template read_array<sizeof(T)>();

    if (!array) {
        return std::unexpected(array.error());
    }

    return endian::from_big<T>(array.value());
}

template <DecodeEndian T, AsReader R>
auto decode_ne(R& source) -> std::expected<T, reader::Error> {
    if constexpr (std::endian::native == std::endian::big) {
        return decode_be<T>(source);
    } else {
        return decode_le<T>(source);
    }
}

}

#endif // DECODE_H
