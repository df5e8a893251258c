#include <algorithm>
#include <format>
#include <stdexcept>

#include "bytes.h"

bytes::Bytes::Bytes(
    std::shared_ptr<const void> owner,
    const std::byte* data,
    size_t size
) noexcept : owner_(std::move(owner)), data_(data), size_(size) {}

bytes::Bytes::Bytes() noexcept : owner_(nullptr), data_(nullptr), size_(0) {}

bytes::Bytes::Bytes(std::vector<std::byte>&& buffer) : Bytes() {
    if (buffer.empty()) {
        return;
    }

    auto storage = std::make_shared<const std::vector<std::byte>>(
        std::move(buffer)
    );

    data_ = storage->data();
    size_ = storage->size();
    owner_ = std::move(storage);
}

auto bytes::Bytes::from_static(std::span<const std::byte> data) noexcept
        -> bytes::Bytes {
    return bytes::Bytes{nullptr, data.data(), data.size()};
}

auto bytes::Bytes::copy_from(std::span<const std::byte> data) -> bytes::Bytes {
    return bytes::Bytes{std::vector<std::byte>(data.begin(), data.end())};
}

auto bytes::Bytes::empty_instance() noexcept -> bytes::Bytes {
    return bytes::Bytes{};
}

auto bytes::Bytes::data() const noexcept -> const std::byte* {
    return data_;
}

auto bytes::Bytes::size() const noexcept -> size_t {
    return size_;
}

auto bytes::Bytes::empty() const noexcept -> bool {
    return size_ == 0;
}

auto bytes::Bytes::view() const noexcept -> std::span<const std::byte> {
    return {data_, size_};
}

auto bytes::Bytes::begin() const noexcept -> const std::byte* {
    return data_;
}

auto bytes::Bytes::end() const noexcept -> const std::byte* {
    return data_ + size_;
}

auto bytes::Bytes::operator[](size_t index) const -> std::byte {
    if (index >= size_) {
        throw std::out_of_range(
            std::format("Byte index {} out of range for size {}", index, size_)
        );
    }

    return data_[index];
}

auto bytes::Bytes::slice(size_t offset, size_t length) const -> bytes::Bytes {
    if (offset > size_ || length > size_ - offset) {
        throw std::out_of_range(
            std::format(
                "Slice [{}, {}+{}) out of range for size {}",
                offset,
                offset,
                length,
                size_
            )
        );
    }

    if (length == 0) {
        return bytes::Bytes::empty_instance();
    }

    // NOTE: Aliasing keeps the original owner alive for the sub-range.
    return bytes::Bytes{owner_, data_ + offset, length};
}

auto bytes::Bytes::slice(size_t offset) const -> bytes::Bytes {
    if (offset > size_) {
        throw std::out_of_range(
            std::format("Slice offset {} out of range for size {}", offset, size_)
        );
    }

    return slice(offset, size_ - offset);
}

auto bytes::Bytes::use_count() const noexcept -> long {
    return owner_.use_count();
}

auto bytes::operator==(const bytes::Bytes& lhs, const bytes::Bytes& rhs) noexcept
        -> bool {
    return std::ranges::equal(lhs.view(), rhs.view());
}
