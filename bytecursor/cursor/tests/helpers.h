#ifndef HELPERS_H
#define HELPERS_H

#include <array>
#include <cstdint>
#include <format>
#include <initializer_list>
#include <vector>

#include "gmock/gmock.h"

#include "bytes.h"

MATCHER_P(EqualsBinary, expected, "Binary elements are equal in size and value") {
    if (arg.size() != expected.size()) {
        *result_listener << "Size of buffers did not match: "
            << expected.size() << " expected, " << arg.size() << " actual";

        return false;
    }

    for (auto i = 0uz; i < expected.size(); ++i) {
        if (expected[i] != arg[i]) {
            *result_listener << "Encountered mismatch at byte index " << i
                << ", expected "
                << std::format("0x{:02X}", std::to_integer<unsigned>(expected[i]))
                << " but got "
                << std::format("0x{:02X}", std::to_integer<unsigned>(arg[i]));

            return false;
        }
    }

    return true;
}

// Bytes 1, 2, ..., N.
template <size_t N>
auto counting_bytes() -> std::array<std::byte, N> {
    std::array<std::byte, N> result{};

    for (auto i = 0uz; i < N; ++i) {
        result[i] = static_cast<std::byte>(i + 1);
    }

    return result;
}

inline auto owned_bytes(std::initializer_list<uint8_t> values) -> bytes::Bytes {
    std::vector<std::byte> buffer{};
    buffer.reserve(values.size());

    for (const auto value : values) {
        buffer.push_back(static_cast<std::byte>(value));
    }

    return bytes::Bytes{std::move(buffer)};
}

#endif // HELPERS_H
