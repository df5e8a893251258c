#ifndef BUFFER_H
#define BUFFER_H

#include <algorithm>
#include <format>
#include <span>
#include <stdexcept>

#include "bytes.h"
#include "endian.h"

namespace buffer {

/**
 * A consumable byte buffer, for decoding code that is generic over where its
 * bytes come from.
 *
 * Unlike reader::Reader, implementations are allowed to throw when asked for
 * more bytes than they hold.
 */
template <typename B>
concept Buf = requires(B& buf, const B& cbuf, size_t count) {
    { cbuf.remaining() } -> std::same_as<size_t>;
    { cbuf.chunk() } -> std::same_as<std::span<const std::byte>>;
    { buf.advance(count) } -> std::same_as<void>;
    { buf.copy_to_bytes(count) } -> std::same_as<bytes::Bytes>;
};

auto has_remaining(const Buf auto& buf, size_t count) -> bool {
    return buf.remaining() >= count;
}

auto copy_to_slice(Buf auto& buf, std::span<std::byte> destination) -> void {
    if (!has_remaining(buf, destination.size())) {
        throw std::out_of_range(
            std::format(
                "Buffer underflow, {} bytes requested but {} remain",
                destination.size(),
                buf.remaining()
            )
        );
    }

    auto written = 0uz;

    while (written < destination.size()) {
        const auto chunk = buf.chunk();
        const auto count = std::min(chunk.size(), destination.size() - written);

        std::copy_n(chunk.begin(), count, destination.begin() + written);
        buf.advance(count);

        written += count;
    }
}

// Big-endian, like the network-order getters of a buffer.
template <endian::MultiByteIntegral V>
auto get(Buf auto& buf) -> V {
    endian::bytes_of<V> array;
    copy_to_slice(buf, array);

    return endian::from_big<V>(array);
}

}

#endif // BUFFER_H
