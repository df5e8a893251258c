#ifndef ENDIAN_H
#define ENDIAN_H

#include <array>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>

#ifdef __cplusplus
extern "C++" {

namespace endian {

__extension__ typedef unsigned __int128 u128;
__extension__ typedef __int128 i128;

template <typename T>
concept SingleByteIntegral =
    std::same_as<T, uint8_t>
    || std::same_as<T, int8_t>;

template <typename T>
concept MultiByteIntegral =
    std::same_as<T, uint16_t>
    || std::same_as<T, uint32_t>
    || std::same_as<T, uint64_t>
    || std::same_as<T, u128>
    || std::same_as<T, int16_t>
    || std::same_as<T, int32_t>
    || std::same_as<T, int64_t>
    || std::same_as<T, i128>;

// NOTE: std::make_unsigned is not required to know about the 128-bit types
// outside of GNU mode, so the mapping is spelled out.
template <typename T>
struct unsigned_of;

template <> struct unsigned_of<uint16_t> { using type = uint16_t; };
template <> struct unsigned_of<uint32_t> { using type = uint32_t; };
template <> struct unsigned_of<uint64_t> { using type = uint64_t; };
template <> struct unsigned_of<u128> { using type = u128; };
template <> struct unsigned_of<int16_t> { using type = uint16_t; };
template <> struct unsigned_of<int32_t> { using type = uint32_t; };
template <> struct unsigned_of<int64_t> { using type = uint64_t; };
template <> struct unsigned_of<i128> { using type = u128; };

template <MultiByteIntegral V>
using bytes_of = std::array<std::byte, sizeof(V)>;

template <MultiByteIntegral V>
auto from_big(const bytes_of<V>& bytes) -> V {
    using U = typename unsigned_of<V>::type;
    U result = 0;

    for (const auto byte : bytes) {
        result = static_cast<U>(result << 8) | std::to_integer<uint8_t>(byte);
    }

    return static_cast<V>(result);
}

template <MultiByteIntegral V>
auto from_little(const bytes_of<V>& bytes) -> V {
    using U = typename unsigned_of<V>::type;
    U result = 0;

    for (auto i = sizeof(V); i > 0; --i) {
        result = static_cast<U>(result << 8)
            | std::to_integer<uint8_t>(bytes[i - 1]);
    }

    return static_cast<V>(result);
}

template <MultiByteIntegral V>
auto from_native(const bytes_of<V>& bytes) -> V {
    if constexpr (std::endian::native == std::endian::big) {
        return from_big<V>(bytes);
    } else {
        return from_little<V>(bytes);
    }
}

}

}
#endif

#endif // ENDIAN_H
