#include "gtest/gtest.h"

#include "reader.h"
#include "tests/helpers.h"

TEST(Reader, ReadsMixedPrimitivesInOrder) {
    static constexpr auto input = std::to_array<const std::byte>({
        std::byte{1}, std::byte{2}, std::byte{3}, std::byte{4},
        std::byte{5}, std::byte{6}, std::byte{7}, std::byte{8},
        std::byte{9}, std::byte{10}, std::byte{11}, std::byte{12},
        std::byte{13}, std::byte{14}, std::byte{15}, std::byte{16}
    });

    reader::Reader cursor{bytes::Bytes::from_static(input)};

    const auto first = cursor.read_bytes(5);
    ASSERT_TRUE(first);
    EXPECT_THAT(std::span{input}.first(5), EqualsBinary(first.value()));

    const auto second = cursor.read_slice(5);
    ASSERT_TRUE(second);
    EXPECT_THAT(std::span{input}.subspan(5, 5), EqualsBinary(second.value()));

    const auto third = cursor.read_array<5>();
    ASSERT_TRUE(third);
    EXPECT_THAT(std::span{input}.subspan(10, 5), EqualsBinary(third.value()));

    const auto last = cursor.read_byte();
    ASSERT_TRUE(last);
    EXPECT_EQ(std::byte{16}, last.value());

    EXPECT_EQ(16uz, cursor.consumed());
    EXPECT_EQ(0uz, cursor.remaining());
    EXPECT_FALSE(cursor.has_remaining(1));
}

TEST(Reader, ReadsWholeInputWithEachPrimitive) {
    const auto input = counting_bytes<20>();
    const auto source = bytes::Bytes::copy_from(input);

    {
        reader::Reader cursor{source};
        const auto result = cursor.read_bytes(20);

        ASSERT_TRUE(result);
        EXPECT_THAT(input, EqualsBinary(result.value()));
    }

    {
        reader::Reader cursor{source};
        const auto result = cursor.read_slice(20);

        ASSERT_TRUE(result);
        EXPECT_THAT(input, EqualsBinary(result.value()));
    }

    {
        reader::Reader cursor{source};
        const auto result = cursor.read_array<20>();

        ASSERT_TRUE(result);
        EXPECT_THAT(input, EqualsBinary(result.value()));
    }
}

TEST(Reader, PartialReadLeavesRemainder) {
    reader::Reader cursor{bytes::Bytes::copy_from(counting_bytes<20>())};

    ASSERT_TRUE(cursor.read_bytes(16));

    EXPECT_EQ(16uz, cursor.consumed());
    EXPECT_EQ(4uz, cursor.remaining());
    EXPECT_TRUE(cursor.has_remaining(4));
    EXPECT_FALSE(cursor.has_remaining(5));
}

TEST(Reader, ShortReadsFailWithoutAdvancing) {
    reader::Reader cursor{owned_bytes({0xAA, 0xBB, 0xCC})};

    ASSERT_TRUE(cursor.read_byte());

    const auto bytes = cursor.read_bytes(3);
    ASSERT_FALSE(bytes);
    EXPECT_EQ(reader::Error::EndOfInput, bytes.error());
    EXPECT_EQ(1uz, cursor.consumed());

    const auto slice = cursor.read_slice(3);
    ASSERT_FALSE(slice);
    EXPECT_EQ(reader::Error::EndOfInput, slice.error());
    EXPECT_EQ(1uz, cursor.consumed());

    const auto array = cursor.read_array<3>();
    ASSERT_FALSE(array);
    EXPECT_EQ(reader::Error::EndOfInput, array.error());
    EXPECT_EQ(1uz, cursor.consumed());

    const auto sub = cursor.subreader(3);
    ASSERT_FALSE(sub);
    EXPECT_EQ(1uz, cursor.consumed());

    const auto rest = cursor.read_slice(2);
    ASSERT_TRUE(rest);
    EXPECT_THAT(owned_bytes({0xBB, 0xCC}), EqualsBinary(rest.value()));
}

TEST(Reader, TracksConsumedPlusRemaining) {
    const auto source = bytes::Bytes::copy_from(counting_bytes<12>());
    reader::Reader cursor{source};

    const auto check = [&]() {
        EXPECT_EQ(source.size(), cursor.consumed() + cursor.remaining());
    };

    ASSERT_TRUE(cursor.read_byte());
    check();
    ASSERT_TRUE(cursor.read_bytes(2));
    check();
    ASSERT_FALSE(cursor.read_slice(100));
    check();
    ASSERT_TRUE(cursor.read_u32());
    check();
    cursor.skip(3);
    check();
    ASSERT_TRUE(cursor.subreader(1));
    check();
    cursor.skip(50);
    check();
    ASSERT_FALSE(cursor.read_byte());
    check();
}

TEST(Reader, EmptyReaderFailsCleanly) {
    reader::Reader cursor{bytes::Bytes{}};

    const auto byte = cursor.read_byte();

    ASSERT_FALSE(byte);
    EXPECT_EQ(reader::Error::EndOfInput, byte.error());
    EXPECT_FALSE(cursor.peek(std::byte{0x00}));

    cursor.skip(100);

    EXPECT_EQ(0uz, cursor.consumed());
    EXPECT_EQ(0uz, cursor.remaining());
}

TEST(Reader, SkipClampsToEnd) {
    reader::Reader cursor{owned_bytes({1, 2, 3, 4})};

    cursor.skip(1);
    EXPECT_EQ(1uz, cursor.consumed());

    cursor.skip(2);
    EXPECT_EQ(3uz, cursor.consumed());
    EXPECT_EQ(std::byte{4}, cursor.read_byte().value());

    cursor.skip(100);
    EXPECT_EQ(4uz, cursor.consumed());
    EXPECT_EQ(0uz, cursor.remaining());
}

TEST(Reader, PeekComparesCurrentByte) {
    reader::Reader cursor{owned_bytes({0x10, 0x20})};

    EXPECT_TRUE(cursor.peek(std::byte{0x10}));
    EXPECT_FALSE(cursor.peek(std::byte{0x20}));
    EXPECT_EQ(0uz, cursor.consumed());

    cursor.skip(1);

    EXPECT_TRUE(cursor.peek(std::byte{0x20}));
    EXPECT_FALSE(cursor.peek(std::byte{0x10}));

    cursor.skip(1);

    EXPECT_FALSE(cursor.peek(std::byte{0x20}));
}

TEST(Reader, ReadBytesIsZeroCopy) {
    const auto source = owned_bytes({1, 2, 3, 4});
    reader::Reader cursor{source};

    cursor.skip(1);
    const auto result = cursor.read_bytes(2);

    ASSERT_TRUE(result);
    EXPECT_EQ(source.data() + 1, result.value().data());
    EXPECT_EQ(3, source.use_count());
}

TEST(Reader, ReadBytesOutlivesReader) {
    auto result = [] {
        reader::Reader cursor{owned_bytes({9, 8, 7})};
        cursor.skip(1);

        return cursor.read_bytes(2);
    }();

    ASSERT_TRUE(result);
    EXPECT_EQ(1, result.value().use_count());
    EXPECT_THAT(owned_bytes({8, 7}), EqualsBinary(result.value()));
}

TEST(Reader, SubreaderIsIndependent) {
    reader::Reader cursor{owned_bytes({1, 2, 3, 4, 5})};

    auto sub = cursor.subreader(3);

    ASSERT_TRUE(sub);
    EXPECT_EQ(3uz, cursor.consumed());
    EXPECT_EQ(3uz, sub.value().remaining());
    EXPECT_EQ(0uz, sub.value().consumed());

    EXPECT_EQ(std::byte{1}, sub.value().read_byte().value());
    EXPECT_EQ(std::byte{4}, cursor.read_byte().value());

    ASSERT_TRUE(sub.value().read_bytes(2));
    EXPECT_FALSE(sub.value().read_byte());
    EXPECT_EQ(std::byte{5}, cursor.read_byte().value());
}

TEST(Reader, ZeroLengthSubreaderIsTruncation) {
    reader::Reader cursor{owned_bytes({1, 2, 3})};

    const auto sub = cursor.subreader(0);

    ASSERT_FALSE(sub);
    EXPECT_EQ(reader::Error::EndOfInput, sub.error());
    EXPECT_EQ(0uz, cursor.consumed());
}

TEST(Reader, ZeroLengthReadsSucceed) {
    reader::Reader cursor{bytes::Bytes{}};

    const auto slice = cursor.read_slice(0);
    ASSERT_TRUE(slice);
    EXPECT_TRUE(slice.value().empty());

    const auto bytes = cursor.read_bytes(0);
    ASSERT_TRUE(bytes);
    EXPECT_TRUE(bytes.value().empty());

    EXPECT_TRUE(cursor.read_array<0>());
    EXPECT_EQ(0uz, cursor.consumed());
}

TEST(Reader, ReadToEndReturnsRemainder) {
    const auto source = owned_bytes({1, 2, 3, 4});
    reader::Reader cursor{source};

    cursor.skip(1);
    const auto rest = std::move(cursor).read_to_end();

    EXPECT_THAT(owned_bytes({2, 3, 4}), EqualsBinary(rest));
    EXPECT_EQ(source.data() + 1, rest.data());
    EXPECT_EQ(2, source.use_count());
}

TEST(Reader, ReadToEndAtEndReleasesStorage) {
    const auto source = owned_bytes({1, 2, 3, 4});
    reader::Reader cursor{source};

    ASSERT_EQ(2, source.use_count());

    cursor.skip(4);
    const auto rest = std::move(cursor).read_to_end();

    EXPECT_TRUE(rest.empty());
    EXPECT_EQ(0, rest.use_count());
    EXPECT_EQ(1, source.use_count());
}

TEST(Reader, IndependentReadersShareStorage) {
    const auto source = owned_bytes({0x01, 0x02});

    reader::Reader first{source};
    reader::Reader second{source};

    EXPECT_EQ(std::byte{0x01}, first.read_byte().value());
    EXPECT_EQ(std::byte{0x01}, second.read_byte().value());
    EXPECT_EQ(std::byte{0x02}, first.read_byte().value());
    EXPECT_EQ(1uz, second.consumed());
}

TEST(Reader, DescribesEndOfInput) {
    EXPECT_EQ("end of input", reader::message(reader::Error::EndOfInput));
    EXPECT_EQ("end of input", std::format("{}", reader::Error::EndOfInput));

    const std::error_code code = reader::Error::EndOfInput;

    EXPECT_EQ(&reader::error_category(), &code.category());
    EXPECT_STREQ("reader", code.category().name());
    EXPECT_EQ("end of input", code.message());
    EXPECT_TRUE(static_cast<bool>(code));
}
