#ifndef BYTES_H
#define BYTES_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

/**
 * bytes::Bytes -- immutable, cheaply copyable view over shared storage.
 *
 * Copies and slices of a Bytes never copy the underlying data. They hold a
 * reference to the same owner, which is released once the last handle is
 * gone. Static data and the empty instance have no owner at all.
 */
namespace bytes {

class Bytes {
private:
    std::shared_ptr<const void> owner_;
    const std::byte* data_;
    size_t size_;

    Bytes(std::shared_ptr<const void>, const std::byte*, size_t) noexcept;
public:
    Bytes() noexcept;
    Bytes(std::vector<std::byte>&&);

    static auto from_static(std::span<const std::byte>) noexcept -> Bytes;
    static auto copy_from(std::span<const std::byte>) -> Bytes;
    static auto empty_instance() noexcept -> Bytes;

    auto data() const noexcept -> const std::byte*;
    auto size() const noexcept -> size_t;
    auto empty() const noexcept -> bool;
    auto view() const noexcept -> std::span<const std::byte>;

    auto begin() const noexcept -> const std::byte*;
    auto end() const noexcept -> const std::byte*;

    auto operator[](size_t) const -> std::byte;

    // Throws std::out_of_range when the range does not fit.
    auto slice(size_t offset, size_t length) const -> Bytes;
    auto slice(size_t offset) const -> Bytes;

    // Number of handles sharing this storage, 0 for unowned data.
    auto use_count() const noexcept -> long;
};

auto operator==(const Bytes&, const Bytes&) noexcept -> bool;

}

#endif // BYTES_H
