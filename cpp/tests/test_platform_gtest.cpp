// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================

#include "guidscan/platform.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>

namespace guidscan::platform::test {

// ==============================================================================
// Преобразование путей UTF-8 <-> path
// ==============================================================================

TEST(PlatformTest, PathFromUtf8_BasicPath) {
    // Arrange
    std::string utf8 = "dumps/registry/export.reg";

    // Act
    std::filesystem::path p = path_from_utf8(utf8);

    // Assert
    EXPECT_EQ(p.filename(), "export.reg");
    EXPECT_EQ(p.extension(), ".reg");
}

TEST(PlatformTest, PathToUtf8_EmptyPath) {
    EXPECT_TRUE(path_to_utf8(std::filesystem::path{}).empty());
    EXPECT_TRUE(path_from_utf8("").empty());
}

TEST(PlatformTest, PathConversion_RoundtripWithSpaces) {
    // Arrange
    std::filesystem::path original = "some path/with  multiple/spaces in name.log";

    // Act
    std::filesystem::path roundtrip = path_from_utf8(path_to_utf8(original));

    // Assert
    EXPECT_EQ(roundtrip.filename(), original.filename());
}

TEST(PlatformTest, PathConversion_RoundtripWithCyrillic) {
    // Arrange
    std::string original_utf8 = "выгрузка/идентификаторы.txt";

    // Act
    std::string roundtrip = path_to_utf8(path_from_utf8(original_utf8));

    // Assert
    EXPECT_NE(roundtrip.find("идентификаторы"), std::string::npos);
}

// ==============================================================================
// TTY detection
// ==============================================================================

TEST(PlatformTest, IsTty_IsStableAcrossCalls) {
    EXPECT_EQ(is_tty_stdout(), is_tty_stdout());
    EXPECT_EQ(is_tty_stderr(), is_tty_stderr());
}

}  // namespace guidscan::platform::test
