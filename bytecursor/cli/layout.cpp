#include <algorithm>
#include <charconv>
#include <format>

#include "decode.h"
#include "layout.h"

namespace {

auto trim(std::string_view text) -> std::string_view {
    const auto first = text.find_first_not_of(" \t");

    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

auto parse_count(std::string_view text) -> std::expected<size_t, layout::Error> {
    auto count = 0uz;
    const auto [end, error] = std::from_chars(
        text.data(),
        text.data() + text.size(),
        count
    );

    if (text.empty() || error != std::errc{} || end != text.data() + text.size()) {
        return std::unexpected(layout::Error::InvalidCount);
    }

    if (count == 0) {
        return std::unexpected(layout::Error::InvalidCount);
    }

    return count;
}

auto parse_order(std::string_view suffix) -> std::expected<layout::Order, layout::Error> {
    if (suffix.empty() || suffix == "be") {
        return layout::Order::Big;
    } else if (suffix == "le") {
        return layout::Order::Little;
    } else if (suffix == "ne") {
        return layout::Order::Native;
    }

    return std::unexpected(layout::Error::UnknownField);
}

auto parse_integer(std::string_view token) -> std::expected<layout::Field, layout::Error> {
    const auto is_signed = token.front() == 'i';
    auto rest = token.substr(1);

    constexpr auto widths = std::to_array<std::pair<std::string_view, size_t>>({
        // NOTE: Longest spellings first so "128" is not taken for "12"
        {"128", 16},
        {"16", 2},
        {"32", 4},
        {"64", 8},
        {"8", 1}
    });

    const auto match = std::ranges::find_if(widths, [rest](const auto& width) {
        return rest.starts_with(width.first);
    });

    if (match == widths.end()) {
        return std::unexpected(layout::Error::UnknownField);
    }

    const auto suffix = rest.substr(match->first.size());

    if (match->second == 1 && !suffix.empty()) {
        return std::unexpected(layout::Error::UnknownField);
    }

    const auto order = parse_order(suffix);

    if (!order) {
        return std::unexpected(order.error());
    }

    return layout::Field{
        std::string{token},
        layout::Kind::Integer,
        match->second,
        is_signed,
        order.value(),
        match->second
    };
}

template <typename T>
auto ordered(reader::Reader& source, layout::Order order)
        -> std::expected<T, reader::Error> {
    switch (order) {
        case layout::Order::Little:
            return decode::decode_le<T>(source);
        case layout::Order::Native:
            return decode::decode_ne<T>(source);
        case layout::Order::Big:
        default:
            return decode::decode_be<T>(source);
    }
}

template <typename W, typename T>
auto widen(std::expected<T, reader::Error> result)
        -> std::expected<layout::Value, reader::Error> {
    if (!result) {
        return std::unexpected(result.error());
    }

    return layout::Value{std::in_place_type<W>, static_cast<W>(result.value())};
}

auto decode_integer(reader::Reader& source, const layout::Field& field)
        -> std::expected<layout::Value, reader::Error> {
    const auto order = field.order;

    switch (field.width) {
        case 1:
            return field.is_signed
                ? widen<int64_t>(decode::decode<int8_t>(source))
                : widen<uint64_t>(decode::decode<uint8_t>(source));
        case 2:
            return field.is_signed
                ? widen<int64_t>(ordered<int16_t>(source, order))
                : widen<uint64_t>(ordered<uint16_t>(source, order));
        case 4:
            return field.is_signed
                ? widen<int64_t>(ordered<int32_t>(source, order))
                : widen<uint64_t>(ordered<uint32_t>(source, order));
        case 8:
            return field.is_signed
                ? widen<int64_t>(ordered<int64_t>(source, order))
                : widen<uint64_t>(ordered<uint64_t>(source, order));
        default:
            return field.is_signed
                ? widen<endian::i128>(ordered<endian::i128>(source, order))
                : widen<endian::u128>(ordered<endian::u128>(source, order));
    }
}

auto to_decimal(endian::u128 value) -> std::string {
    if (value == 0) {
        return "0";
    }

    std::string digits{};

    while (value > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }

    std::ranges::reverse(digits);
    return digits;
}

auto to_hex(endian::u128 value) -> std::string {
    const auto high = static_cast<uint64_t>(value >> 64);
    const auto low = static_cast<uint64_t>(value);

    if (high == 0) {
        return std::format("0x{:X}", low);
    }

    return std::format("0x{:X}{:016X}", high, low);
}

}

auto layout::describe(layout::Error error) noexcept -> std::string_view {
    switch (error) {
        case layout::Error::EmptyLayout:
            return "layout has no fields";
        case layout::Error::UnknownField:
            return "unknown field type";
        case layout::Error::InvalidCount:
            return "byte count must be a positive integer";
        case layout::Error::RestNotLast:
            return "rest may only appear as the last field";
        default:
            return "unknown layout error";
    }
}

auto layout::parse_field(std::string_view text) -> std::expected<layout::Field, layout::Error> {
    const auto token = trim(text);

    if (token.empty()) {
        return std::unexpected(layout::Error::UnknownField);
    }

    if (token == "rest") {
        return layout::Field{
            std::string{token}, layout::Kind::Rest, 0, false, layout::Order::Big, 0
        };
    }

    const auto separator = token.find(':');

    if (separator != std::string_view::npos) {
        const auto name = token.substr(0, separator);
        const auto count = parse_count(token.substr(separator + 1));

        if (name != "bytes" && name != "skip") {
            return std::unexpected(layout::Error::UnknownField);
        }

        if (!count) {
            return std::unexpected(count.error());
        }

        return layout::Field{
            std::string{token},
            name == "bytes" ? layout::Kind::Bytes : layout::Kind::Skip,
            0,
            false,
            layout::Order::Big,
            count.value()
        };
    }

    if (token.front() == 'u' || token.front() == 'i') {
        return parse_integer(token);
    }

    return std::unexpected(layout::Error::UnknownField);
}

auto layout::parse(std::string_view text) -> std::expected<std::vector<layout::Field>, layout::Error> {
    if (trim(text).empty()) {
        return std::unexpected(layout::Error::EmptyLayout);
    }

    std::vector<layout::Field> fields{};

    while (true) {
        const auto separator = text.find(',');
        const auto field = layout::parse_field(text.substr(0, separator));

        if (!field) {
            return std::unexpected(field.error());
        }

        if (!fields.empty() && fields.back().kind == layout::Kind::Rest) {
            return std::unexpected(layout::Error::RestNotLast);
        }

        fields.push_back(field.value());

        if (separator == std::string_view::npos) {
            break;
        }

        text.remove_prefix(separator + 1);
    }

    return fields;
}

auto layout::decode_field(reader::Reader& source, const layout::Field& field)
        -> std::expected<layout::Value, reader::Error> {
    switch (field.kind) {
        case layout::Kind::Integer:
            return decode_integer(source, field);
        case layout::Kind::Bytes: {
            auto bytes = source.read_bytes(field.count);

            if (!bytes) {
                return std::unexpected(bytes.error());
            }

            return layout::Value{std::move(bytes.value())};
        }
        case layout::Kind::Skip: {
            // NOTE: Reader::skip() clamps silently, a layout asks for the
            // bytes to actually be there.
            if (!source.has_remaining(field.count)) {
                return std::unexpected(reader::Error::EndOfInput);
            }

            source.skip(field.count);
            return layout::Value{layout::Skipped{field.count}};
        }
        case layout::Kind::Rest:
        default: {
            auto bytes = source.read_bytes(source.remaining());

            if (!bytes) {
                return std::unexpected(bytes.error());
            }

            return layout::Value{std::move(bytes.value())};
        }
    }
}

auto layout::hex(std::span<const std::byte> data) -> std::string {
    std::string result{};
    result.reserve(data.size() * 3);

    for (const auto byte : data) {
        if (!result.empty()) {
            result.push_back(' ');
        }

        result += std::format("{:02X}", std::to_integer<unsigned>(byte));
    }

    return result;
}

auto layout::format_value(const layout::Value& value) -> std::string {
    if (const auto* unsigned_value = std::get_if<uint64_t>(&value)) {
        return std::format("{} (0x{:X})", *unsigned_value, *unsigned_value);
    }

    if (const auto* signed_value = std::get_if<int64_t>(&value)) {
        return std::format("{}", *signed_value);
    }

    if (const auto* wide = std::get_if<endian::u128>(&value)) {
        return std::format("{} ({})", to_decimal(*wide), to_hex(*wide));
    }

    if (const auto* wide = std::get_if<endian::i128>(&value)) {
        if (*wide < 0) {
            // NOTE: Negating in the unsigned domain keeps the minimum value
            // representable.
            return "-" + to_decimal(-static_cast<endian::u128>(*wide));
        }

        return to_decimal(static_cast<endian::u128>(*wide));
    }

    if (const auto* data = std::get_if<bytes::Bytes>(&value)) {
        if (data->empty()) {
            return "(empty)";
        }

        return std::format("[{}] ({} bytes)", layout::hex(data->view()), data->size());
    }

    const auto skipped = std::get<layout::Skipped>(value);
    return std::format("(skipped {} bytes)", skipped.count);
}
