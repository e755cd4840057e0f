// ==============================================================================
// test_text_reader_gtest.cpp - Тесты блочного чтения файла (GoogleTest)
// ==============================================================================

#include "guidscan/text_reader.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace guidscan::io::test {

class TextReaderTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("guidscan_reader_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );

        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& bytes) {
        std::filesystem::path path = test_dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        return path;
    }
};

// ==============================================================================
// Открытие
// ==============================================================================

TEST_F(TextReaderTest, Open_MissingPath) {
    // Act
    auto result = TextReader::open(test_dir_ / "missing.log", Encoding::AutoDetect);

    // Assert
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.reader, nullptr);
    EXPECT_EQ(result.error.kind, ReaderErrorKind::PathNotFound);
    EXPECT_NE(result.error.format().find("failed to scan file '"), std::string::npos);
}

TEST_F(TextReaderTest, Open_Directory) {
    auto result = TextReader::open(test_dir_, Encoding::AutoDetect);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ReaderErrorKind::NotAFile);
}

TEST_F(TextReaderTest, ErrorKind_ToString) {
    EXPECT_STREQ(reader_error_kind_to_string(ReaderErrorKind::PathNotFound), "PathNotFound");
    EXPECT_STREQ(reader_error_kind_to_string(ReaderErrorKind::AccessDenied), "AccessDenied");
    EXPECT_STREQ(reader_error_kind_to_string(ReaderErrorKind::NotAFile), "NotAFile");
    EXPECT_STREQ(reader_error_kind_to_string(ReaderErrorKind::IoError), "IoError");
}

TEST(ReaderErrorTest, Format) {
    ReaderError error{ReaderErrorKind::NotAFile, "path is not a file", "/var/log"};

    EXPECT_EQ(error.format(), "failed to scan file '/var/log' - path is not a file");
}

// ==============================================================================
// Чтение блоками
// ==============================================================================

TEST_F(TextReaderTest, Read_RespectsMaxChars) {
    // Arrange
    auto path = write_file("abc.txt", "abcdefghij");
    auto opened = TextReader::open(path, Encoding::AutoDetect);
    ASSERT_TRUE(opened.ok);
    TextReader& reader = *opened.reader;
    std::u32string block;

    // Act / Assert
    EXPECT_EQ(reader.read(block, 4), 4u);
    EXPECT_EQ(block, U"abcd");
    EXPECT_FALSE(reader.at_end());

    block.clear();
    EXPECT_EQ(reader.read(block, 4), 4u);
    EXPECT_EQ(block, U"efgh");

    block.clear();
    EXPECT_EQ(reader.read(block, 4), 2u);
    EXPECT_EQ(block, U"ij");
    EXPECT_TRUE(reader.at_end());

    block.clear();
    EXPECT_EQ(reader.read(block, 4), 0u);
    EXPECT_EQ(reader.chars_read(), 10u);
    EXPECT_EQ(reader.bytes_read(), 10u);
    EXPECT_FALSE(reader.last_error().has_value());
}

TEST_F(TextReaderTest, Read_CountsCharactersNotBytes) {
    // Arrange: 3 символа кириллицы = 6 байт UTF-8
    auto path = write_file("cyr.txt", "\xD0\xB0\xD0\xB1\xD0\xB2");
    auto opened = TextReader::open(path, Encoding::Utf8);
    ASSERT_TRUE(opened.ok);
    std::u32string block;

    // Act
    std::size_t n = opened.reader->read(block, 2);

    // Assert
    EXPECT_EQ(n, 2u);
    EXPECT_EQ(block, U"\u0430\u0431");
}

TEST_F(TextReaderTest, Read_LargerThanRawChunk) {
    // Arrange
    std::string content(RAW_READ_BYTES * 2 + 123, 'q');
    auto path = write_file("large.txt", content);
    auto opened = TextReader::open(path, Encoding::AutoDetect);
    ASSERT_TRUE(opened.ok);

    // Act
    std::u32string all;
    std::u32string block;
    while (opened.reader->read(block, 10000) > 0) {
        all += block;
        block.clear();
    }

    // Assert
    EXPECT_EQ(all.size(), content.size());
    EXPECT_EQ(opened.reader->chars_read(), content.size());
}

TEST_F(TextReaderTest, EmptyFile_AtEndImmediately) {
    auto path = write_file("empty.txt", "");
    auto opened = TextReader::open(path, Encoding::AutoDetect);
    ASSERT_TRUE(opened.ok);

    std::u32string block;
    EXPECT_TRUE(opened.reader->at_end());
    EXPECT_EQ(opened.reader->read(block, 100), 0u);
}

// ==============================================================================
// Кодировка и BOM
// ==============================================================================

TEST_F(TextReaderTest, AutoDetect_NoBomIsUtf8) {
    auto path = write_file("plain.txt", "guid");
    auto opened = TextReader::open(path, Encoding::AutoDetect);
    ASSERT_TRUE(opened.ok);

    std::u32string block;
    opened.reader->read(block, 100);

    EXPECT_EQ(opened.reader->encoding(), Encoding::Utf8);
    EXPECT_EQ(block, U"guid");
}

TEST_F(TextReaderTest, AutoDetect_Utf8BomIsStripped) {
    auto path = write_file("bom.txt", "\xEF\xBB\xBF" "guid");
    auto opened = TextReader::open(path, Encoding::AutoDetect);
    ASSERT_TRUE(opened.ok);

    std::u32string block;
    opened.reader->read(block, 100);

    EXPECT_EQ(opened.reader->encoding(), Encoding::Utf8);
    EXPECT_EQ(block, U"guid");
}

TEST_F(TextReaderTest, AutoDetect_Utf16BigEndianBom) {
    auto path = write_file("be.txt", std::string("\xFE\xFF\0g\0u\0i\0d", 10));
    auto opened = TextReader::open(path, Encoding::AutoDetect);
    ASSERT_TRUE(opened.ok);

    std::u32string block;
    opened.reader->read(block, 100);

    EXPECT_EQ(opened.reader->encoding(), Encoding::BigEndianUnicode);
    EXPECT_EQ(block, U"guid");
}

TEST_F(TextReaderTest, ExplicitEncoding_OverridesBomDetection) {
    // Arrange: явная ASCII, BOM остаётся в тексте как U+FFFD
    auto path = write_file("ascii.txt", "\xEF\xBB\xBF" "ab");
    auto opened = TextReader::open(path, Encoding::Ascii);
    ASSERT_TRUE(opened.ok);

    // Act
    std::u32string block;
    opened.reader->read(block, 100);

    // Assert
    EXPECT_EQ(opened.reader->encoding(), Encoding::Ascii);
    ASSERT_EQ(block.size(), 5u);
    EXPECT_EQ(block[0], REPLACEMENT_CHAR);
    EXPECT_EQ(block[4], U'b');
}

}  // namespace guidscan::io::test
