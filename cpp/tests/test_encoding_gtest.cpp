// ==============================================================================
// test_encoding_gtest.cpp - Тесты декодеров и определения BOM (GoogleTest)
// ==============================================================================

#include "guidscan/encoding.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <string>

namespace guidscan::io::test {

namespace {

std::optional<Encoding> bom(std::string bytes) {
    return detect_bom(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
}

}  // anonymous namespace

// ==============================================================================
// Имена кодировок
// ==============================================================================

TEST(EncodingTest, FromString_CaseInsensitiveWithAliases) {
    EXPECT_EQ(encoding_from_string("AutoDetect"), Encoding::AutoDetect);
    EXPECT_EQ(encoding_from_string("ascii"), Encoding::Ascii);
    EXPECT_EQ(encoding_from_string("Unicode"), Encoding::Unicode);
    EXPECT_EQ(encoding_from_string("UTF-16LE"), Encoding::Unicode);
    EXPECT_EQ(encoding_from_string("utf32"), Encoding::Utf32);
    EXPECT_EQ(encoding_from_string("UTF-7"), Encoding::Utf7);
    EXPECT_EQ(encoding_from_string("utf8"), Encoding::Utf8);
    EXPECT_EQ(encoding_from_string("UTF-8"), Encoding::Utf8);
}

TEST(EncodingTest, FromString_Unknown) {
    EXPECT_FALSE(encoding_from_string("latin1").has_value());
    EXPECT_FALSE(encoding_from_string("").has_value());
}

TEST(EncodingTest, ToString_RoundTripsThroughFromString) {
    for (Encoding e : {Encoding::AutoDetect, Encoding::Ascii, Encoding::Unicode, Encoding::Utf32,
                       Encoding::Utf7, Encoding::Utf8}) {
        EXPECT_EQ(encoding_from_string(encoding_to_string(e)), e) << encoding_to_string(e);
    }
}

// ==============================================================================
// BOM
// ==============================================================================

TEST(EncodingTest, DetectBom_AllMarks) {
    EXPECT_EQ(bom("\xEF\xBB\xBF" "abc"), Encoding::Utf8);
    EXPECT_EQ(bom(std::string("\xFF\xFE" "a\0", 4)), Encoding::Unicode);
    EXPECT_EQ(bom("\xFE\xFF"), Encoding::BigEndianUnicode);
    EXPECT_EQ(bom(std::string("\xFF\xFE\x00\x00", 4)), Encoding::Utf32);
    EXPECT_EQ(bom(std::string("\x00\x00\xFE\xFF", 4)), Encoding::Utf32BigEndian);
    EXPECT_EQ(bom("+/v8"), Encoding::Utf7);
}

TEST(EncodingTest, DetectBom_None) {
    EXPECT_FALSE(bom("A864F394").has_value());
    EXPECT_FALSE(bom("").has_value());
    EXPECT_FALSE(bom("\xFF").has_value());
}

// ==============================================================================
// Декодеры
// ==============================================================================

TEST(EncodingTest, Utf8_MultiByte) {
    EXPECT_EQ(decode_all(Encoding::Utf8, "a\xD0\xB6\xE2\x82\xAC\xF0\x9F\x98\x80"),
              U"a\u0436\u20AC\U0001F600");
}

TEST(EncodingTest, Utf8_InvalidBytesBecomeReplacement) {
    std::u32string out = decode_all(Encoding::Utf8, "a\xC0\x80" "b\xE2\x82");

    ASSERT_EQ(out.size(), 5u);
    EXPECT_EQ(out[0], U'a');
    EXPECT_EQ(out[1], REPLACEMENT_CHAR);
    EXPECT_EQ(out[2], REPLACEMENT_CHAR);
    EXPECT_EQ(out[3], U'b');
    EXPECT_EQ(out[4], REPLACEMENT_CHAR);
}

TEST(EncodingTest, Utf8_SequenceSplitAcrossChunks) {
    // Arrange
    auto decoder = create_decoder(Encoding::Utf8);
    const std::uint8_t part1[] = {'x', 0xE2, 0x82};
    const std::uint8_t part2[] = {0xAC, 'y'};
    std::u32string out;

    // Act
    decoder->decode(part1, sizeof(part1), out);
    decoder->decode(part2, sizeof(part2), out);
    decoder->finish(out);

    // Assert
    EXPECT_EQ(out, U"x\u20ACy");
}

TEST(EncodingTest, Ascii_HighBytesBecomeReplacement) {
    std::u32string out = decode_all(Encoding::Ascii, "ok\xC3\xA9");

    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[2], REPLACEMENT_CHAR);
    EXPECT_EQ(out[3], REPLACEMENT_CHAR);
}

TEST(EncodingTest, Utf16_LittleAndBigEndian) {
    EXPECT_EQ(decode_all(Encoding::Unicode, std::string("A\0\x36\x04", 4)), U"A\u0436");
    EXPECT_EQ(decode_all(Encoding::BigEndianUnicode, std::string("\0A\x04\x36", 4)), U"A\u0436");
}

TEST(EncodingTest, Utf16_SurrogatePair) {
    // U+1F600 = D83D DE00
    EXPECT_EQ(decode_all(Encoding::Unicode, std::string("\x3D\xD8\x00\xDE", 4)), U"\U0001F600");
}

TEST(EncodingTest, Utf16_LoneSurrogateAndOddByte) {
    std::u32string out = decode_all(Encoding::Unicode, std::string("\x3D\xD8" "A\0" "B", 5));

    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0], REPLACEMENT_CHAR);
    EXPECT_EQ(out[1], U'A');
    EXPECT_EQ(out[2], REPLACEMENT_CHAR);
}

TEST(EncodingTest, Utf32_LittleEndian) {
    EXPECT_EQ(decode_all(Encoding::Utf32, std::string("\x00\xF6\x01\x00" "A\0\0\0", 8)),
              U"\U0001F600A");
}

TEST(EncodingTest, Utf7_Base64Section) {
    // Пример из RFC 2152: "+Jjo-" кодирует U+263A
    EXPECT_EQ(decode_all(Encoding::Utf7, "Hi Mom -+Jjo--!"), U"Hi Mom -\u263A-!");
}

TEST(EncodingTest, Utf7_LiteralPlus) {
    EXPECT_EQ(decode_all(Encoding::Utf7, "1 +- 1"), U"1 + 1");
}

TEST(EncodingTest, AutoDetect_DecodesAsUtf8) {
    auto decoder = create_decoder(Encoding::AutoDetect);

    EXPECT_EQ(decoder->encoding(), Encoding::Utf8);
}

}  // namespace guidscan::io::test
