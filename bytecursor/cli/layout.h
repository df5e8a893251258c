#ifndef LAYOUT_H
#define LAYOUT_H

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "bytes.h"
#include "endian.h"
#include "reader.h"

/**
 * Field layouts for the inspect command.
 *
 * A layout is a comma separated list of fields, decoded in order:
 *
 *   u8, i8                       single bytes
 *   u16 ... i128 [le|be|ne]      integers, big-endian unless suffixed
 *   bytes:N                      N raw bytes
 *   skip:N                       N ignored bytes
 *   rest                         everything left, only as the last field
 */
namespace layout {

enum Error {
    EmptyLayout,
    UnknownField,
    InvalidCount,
    RestNotLast
};

enum class Kind : uint8_t {
    Integer,
    Bytes,
    Skip,
    Rest
};

enum class Order : uint8_t {
    Big,
    Little,
    Native
};

struct Field {
    std::string name;
    Kind kind;
    size_t width;
    bool is_signed;
    Order order;
    size_t count;
};

struct Skipped {
    size_t count;
};

using Value = std::variant<
    uint64_t,
    int64_t,
    endian::u128,
    endian::i128,
    bytes::Bytes,
    Skipped
>;

auto describe(Error) noexcept -> std::string_view;

auto parse(std::string_view) -> std::expected<std::vector<Field>, Error>;
auto parse_field(std::string_view) -> std::expected<Field, Error>;

auto decode_field(reader::Reader&, const Field&)
    -> std::expected<Value, reader::Error>;

auto format_value(const Value&) -> std::string;
auto hex(std::span<const std::byte>) -> std::string;

}

#endif // LAYOUT_H
