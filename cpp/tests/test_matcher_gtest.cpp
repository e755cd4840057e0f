// ==============================================================================
// test_matcher_gtest.cpp - Тесты поиска GUID-литералов (GoogleTest)
// ==============================================================================

#include "guidscan/matcher.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace guidscan::scan::test {

namespace {

constexpr const char* EXPECTED = "a864f394-c94e-4727-8eeb-89223e3096af";

std::vector<Match> find(const std::u32string& buffer) {
    Matcher matcher(buffer);
    return matcher.find_all();
}

std::string canonical(const Match& m) {
    auto result = canonicalize(m);
    return result ? result.guid.to_string() : std::string("<") + result.candidate + ">";
}

}  // anonymous namespace

// ==============================================================================
// Три формы литерала
// ==============================================================================

TEST(MatcherTest, CanonicalForm) {
    // Act
    auto matches = find(U"id=A864F394-C94E-4727-8EEB-89223E3096AF;");

    // Assert
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].offset, 3u);
    EXPECT_EQ(matches[0].length, 36u);
    EXPECT_EQ(matches[0].text, "A864F394-C94E-4727-8EEB-89223E3096AF");
    EXPECT_EQ(canonical(matches[0]), EXPECTED);
}

TEST(MatcherTest, StructInitializerForm) {
    // Act
    auto matches =
        find(U"{0xa864f394,0xc94e,0x4727,0x8e,0xeb,0x89,0x22,0x3e,0x30,0x96,0xaf};");

    // Assert
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].time_low, "a864f394");
    EXPECT_EQ(matches[0].time_fields[0], "c94e");
    EXPECT_EQ(matches[0].node[5], "af");
    EXPECT_EQ(canonical(matches[0]), EXPECTED);
}

TEST(MatcherTest, BracedNodeForm) {
    // Act
    auto matches =
        find(U"{0xa864f394,0xc94e,0x4727,{0x8e,0xeb,0x89,0x22,0x3e,0x30,0x96,0xaf}}");

    // Assert
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].text.back(), '}');
    EXPECT_EQ(canonical(matches[0]), EXPECTED);
}

TEST(MatcherTest, AllFormsCanonicalizeToSameGuid) {
    // Arrange
    std::u32string buffer =
        U"A864F394-C94E-4727-8EEB-89223E3096AF"
        U"|0xa864f394,0xc94e,0x4727,0x8e,0xeb,0x89,0x22,0x3e,0x30,0x96,0xaf"
        U"|0xA864F394,0xC94E,0x4727,{0x8E,0xEB,0x89,0x22,0x3E,0x30,0x96,0xAF}";

    // Act
    auto matches = find(buffer);

    // Assert
    ASSERT_EQ(matches.size(), 3u);
    for (const auto& m : matches) {
        EXPECT_EQ(canonical(m), EXPECTED);
    }
}

TEST(MatcherTest, CommaSeparatedPlainHex) {
    auto matches = find(U"a864f394,c94e,4727,8e,eb,89,22,3e,30,96,af");

    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(canonical(matches[0]), EXPECTED);
}

TEST(MatcherTest, HyphenlessHex32) {
    auto matches = find(U"a864f394c94e47278eeb89223e3096af");

    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(canonical(matches[0]), EXPECTED);
}

// ==============================================================================
// Перебор и границы
// ==============================================================================

TEST(MatcherTest, NonOverlapping_LeftToRight) {
    // Arrange
    std::u32string buffer = U"00000000-0000-0000-0000-000000000001,"
                            U"00000000-0000-0000-0000-000000000002";

    // Act
    Matcher matcher(buffer);
    Match first;
    Match second;
    Match third;

    // Assert
    ASSERT_TRUE(matcher.next(first));
    EXPECT_EQ(matcher.position(), first.end());
    ASSERT_TRUE(matcher.next(second));
    EXPECT_FALSE(matcher.next(third));
    EXPECT_EQ(first.offset, 0u);
    EXPECT_EQ(second.offset, 37u);
    EXPECT_EQ(canonical(second), "00000000-0000-0000-0000-000000000002");
}

TEST(MatcherTest, StartOffset_SkipsEarlierText) {
    std::u32string buffer = U"A864F394-C94E-4727-8EEB-89223E3096AF";

    Matcher matcher(buffer, 1);
    Match m;

    EXPECT_FALSE(matcher.next(m));
}

TEST(MatcherTest, NoMatch_PlainText) {
    EXPECT_TRUE(find(U"").empty());
    EXPECT_TRUE(find(U"no identifiers here, only words-and-dashes").empty());
    EXPECT_TRUE(find(U"A864F394-C94E-4727-8EEB").empty());
}

TEST(MatcherTest, NoMatch_WrongFieldWidth) {
    // 7 цифр в первом поле без префикса 0x
    EXPECT_TRUE(find(U"A864F39-C94E-4727-8EEB-89223E3096AF").empty());
}

TEST(MatcherTest, OverlongFirstField_MatchesAtLaterPosition) {
    // Arrange: 9 цифр в начале
    auto matches = find(U"1A864F394-C94E-4727-8EEB-89223E3096AF");

    // Assert: совпадение начинается на первой позиции, где грамматика полна
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].offset, 1u);
    EXPECT_EQ(canonical(matches[0]), EXPECTED);
}

// ==============================================================================
// Канонизация коротких полей
// ==============================================================================

TEST(MatcherTest, ShortPrefixedField_FailsCanonicalization) {
    // Arrange
    auto matches = find(U"0xa864f394,0xc94e,0x4727,0xe,0xeb,0x89,0x22,0x3e,0x30,0x96,0xaf");

    // Act
    ASSERT_EQ(matches.size(), 1u);
    auto result = canonicalize(matches[0]);

    // Assert
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.status, GuidParseResult::BadSize);
    EXPECT_EQ(result.candidate, "a864f394-c94e-4727-eeb-89223e3096af");
}

TEST(MatcherTest, ReconstructCanonical_JoinsFields) {
    // Arrange
    Match m;
    m.time_low = "A864F394";
    m.time_fields = {"C94E", "4727"};
    m.clock_seq = {"8E", "EB"};
    m.node = {"89", "22", "3E", "30", "96", "AF"};

    // Act / Assert
    EXPECT_EQ(reconstruct_canonical(m), "A864F394-C94E-4727-8EEB-89223E3096AF");
}

}  // namespace guidscan::scan::test
