#include <algorithm>
#include <limits>

#include "stream.h"

auto reader::read_into(reader::Reader& source, std::span<std::byte> destination) noexcept
        -> size_t {
    const auto count = std::min(source.remaining(), destination.size());

    if (count == 0) {
        return 0;
    }

    const auto slice = source.read_slice(count);

    if (!slice) {
        return 0;
    }

    std::copy_n(slice.value().begin(), count, destination.begin());

    return count;
}

reader::StreamBuf::StreamBuf(reader::Reader& source) noexcept : reader_(source) {}

auto reader::StreamBuf::showmanyc() -> std::streamsize {
    const auto remaining = reader_.remaining();

    if (remaining == 0) {
        return -1;
    }

    return static_cast<std::streamsize>(
        std::min<size_t>(remaining, std::numeric_limits<std::streamsize>::max())
    );
}

auto reader::StreamBuf::underflow() -> int_type {
    if (!reader_.has_remaining(1)) {
        return traits_type::eof();
    }

    const auto byte = reader_.inner_.data()[reader_.position_];

    return traits_type::to_int_type(
        static_cast<char_type>(std::to_integer<unsigned char>(byte))
    );
}

auto reader::StreamBuf::uflow() -> int_type {
    const auto byte = reader_.read_byte();

    if (!byte) {
        return traits_type::eof();
    }

    return traits_type::to_int_type(
        static_cast<char_type>(std::to_integer<unsigned char>(byte.value()))
    );
}

auto reader::StreamBuf::xsgetn(char_type* destination, std::streamsize count)
        -> std::streamsize {
    if (count <= 0) {
        return 0;
    }

    const auto copied = reader::read_into(
        reader_,
        std::as_writable_bytes(
            std::span<char_type>{destination, static_cast<size_t>(count)}
        )
    );

    return static_cast<std::streamsize>(copied);
}
