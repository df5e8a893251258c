#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "bytes.h"
#include "layout.h"
#include "logging.h"
#include "reader.h"

using namespace std::literals;

constexpr auto dump_line_width = 16uz;

auto root_help() -> void {
    std::println(stderr, "bytecursor CLI v0.1.0\n");
    std::println(stderr, "Decodes binary files with a bounds-checked cursor\n");
    std::println(stderr, "USAGE");
    std::println(stderr, "  $ bytecursor inspect <file> <layout> - Decodes fields in order");
    std::println(stderr, "  $ bytecursor dump <file> - Prints a hex dump\n");
    std::println(stderr, "Layout fields (comma separated):");
    std::println(stderr, "  u8, i8, u16..i128 with optional le/be/ne suffix (default be)");
    std::println(stderr, "  bytes:N, skip:N, rest\n");
    std::println(stderr, "Flags:");
    std::println(stderr, "  -h, --help print this message");
}

auto root_usage() -> void {
    std::println(stderr, "Usage:");
    std::println(stderr, "  bytecursor (-h|--help)");
    std::println(stderr, "  bytecursor inspect <FILE> <LAYOUT>");
    std::println(stderr, "  bytecursor dump <FILE>");
}

auto read_file(const std::filesystem::path& target) -> bytes::Bytes {
    if (!std::filesystem::exists(target)) {
        throw std::runtime_error(
            std::format("Requested file ({}) does not exist", target.string())
        );
    }

    std::ifstream file_reader{target, std::ios::binary | std::ios::ate};

    if (!file_reader.is_open()) {
        throw std::runtime_error(
            std::format("Failed to open file ({})", target.string())
        );
    }

    const auto size = file_reader.tellg();
    file_reader.seekg(0, std::ios::beg);

    std::vector<std::byte> contents{};
    contents.resize(size);

    if (!file_reader.read(reinterpret_cast<char*>(contents.data()), size)) {
        throw std::runtime_error(
            std::format("Failed to read file ({}) contents", target.string())
        );
    }

    return bytes::Bytes{std::move(contents)};
}

auto inspect_file(const std::filesystem::path& target, std::string_view description)
        -> void {
    const auto fields = layout::parse(description);

    if (!fields) {
        throw std::runtime_error(
            std::format(
                "Invalid layout ({}): {}",
                description,
                layout::describe(fields.error())
            )
        );
    }

    reader::Reader cursor{read_file(target)};

    std::println("Fields of {} ({} bytes):", target.string(), cursor.remaining());

    for (auto i = 0uz; i < fields.value().size(); ++i) {
        const auto& field = fields.value()[i];
        const auto offset = cursor.consumed();
        const auto value = layout::decode_field(cursor, field);

        if (!value) {
            throw std::runtime_error(
                std::format(
                    "Field #{} ({}) at offset {}: {}",
                    i + 1,
                    field.name,
                    offset,
                    value.error()
                )
            );
        }

        std::println(
            "  [{:08X}] {:<8} = {}",
            offset,
            field.name,
            layout::format_value(value.value())
        );
    }

    if (cursor.remaining() > 0) {
        logging::warning(
            std::format(
                "{} trailing bytes left unread at offset {}",
                cursor.remaining(),
                cursor.consumed()
            )
        );
    }
}

auto print_dump_line(size_t offset, std::span<const std::byte> line) -> void {
    std::string text{};

    for (const auto byte : line) {
        const auto value = std::to_integer<unsigned char>(byte);
        text.push_back(value >= 0x20 && value < 0x7F ? static_cast<char>(value) : '.');
    }

    std::println(
        "{:08X}  {:<{}}  |{}|",
        offset,
        layout::hex(line),
        dump_line_width * 3 - 1,
        text
    );
}

auto dump_file(const std::filesystem::path& target) -> void {
    reader::Reader cursor{read_file(target)};

    while (cursor.has_remaining(dump_line_width)) {
        const auto offset = cursor.consumed();
        auto line = cursor.subreader(dump_line_width);

        if (!line) {
            throw std::runtime_error(
                std::format("Failed to read line at offset {}: {}", offset, line.error())
            );
        }

        print_dump_line(offset, std::move(line.value()).read_to_end().view());
    }

    const auto offset = cursor.consumed();
    const auto tail = std::move(cursor).read_to_end();

    if (!tail.empty()) {
        print_dump_line(offset, tail.view());
    }
}

auto main(int argc, char** argv) -> int {
    if (argc < 2) {
        root_usage();
        return EXIT_FAILURE;
    }

    if (argv[1] == "-h"sv || argv[1] == "--help"sv) {
        root_help();
        return EXIT_SUCCESS;
    }

    try {
        if (argv[1] == "inspect"sv && argc == 4) {
            inspect_file(argv[2], argv[3]);
        } else if (argv[1] == "dump"sv && argc == 3) {
            dump_file(argv[2]);
        } else {
            root_usage();
            return EXIT_FAILURE;
        }
    } catch (const std::runtime_error& e) {
        logging::error(e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
