// ==============================================================================
// test_accumulator_gtest.cpp - Тесты подсчёта вхождений (GoogleTest)
// ==============================================================================

#include "guidscan/accumulator.hpp"

#include <algorithm>
#include <gtest/gtest.h>

namespace guidscan::scan::test {

namespace {

Guid make(const char* str) {
    return *Guid::parse(str);
}

const GuidRecord* find_record(const std::vector<GuidRecord>& records, const Guid& guid) {
    auto it = std::find_if(records.begin(), records.end(),
                           [&guid](const GuidRecord& r) { return r.guid == guid; });
    return it == records.end() ? nullptr : &*it;
}

}  // anonymous namespace

TEST(AccumulatorTest, Empty) {
    GuidAccumulator acc;

    EXPECT_TRUE(acc.empty());
    EXPECT_EQ(acc.unique_count(), 0u);
    EXPECT_EQ(acc.total_count(), 0u);
    EXPECT_TRUE(acc.results().empty());
}

TEST(AccumulatorTest, Record_CountsRepeats) {
    // Arrange
    GuidAccumulator acc;
    Guid a = make("a864f394-c94e-4727-8eeb-89223e3096af");
    Guid b = make("00000000-0000-0000-0000-000000000001");

    // Act
    EXPECT_TRUE(acc.record(a));
    EXPECT_FALSE(acc.record(a));
    EXPECT_TRUE(acc.record(b));
    EXPECT_FALSE(acc.record(a));

    // Assert
    EXPECT_EQ(acc.unique_count(), 2u);
    EXPECT_EQ(acc.total_count(), 4u);

    auto results = acc.results();
    ASSERT_EQ(results.size(), 2u);
    const GuidRecord* ra = find_record(results, a);
    const GuidRecord* rb = find_record(results, b);
    ASSERT_NE(ra, nullptr);
    ASSERT_NE(rb, nullptr);
    EXPECT_EQ(ra->count, 3u);
    EXPECT_EQ(rb->count, 1u);
}

TEST(AccumulatorTest, Record_KeepsFirstOffset) {
    // Arrange
    GuidAccumulator acc;
    Guid a = make("a864f394-c94e-4727-8eeb-89223e3096af");

    // Act
    acc.record(a, 120);
    acc.record(a, 40);
    acc.record(a, 900);

    // Assert
    auto results = acc.results();
    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].first_offset.has_value());
    EXPECT_EQ(*results[0].first_offset, 120u);
}

TEST(AccumulatorTest, Record_WithoutOffset) {
    GuidAccumulator acc;
    acc.record(make("a864f394-c94e-4727-8eeb-89223e3096af"));

    auto results = acc.results();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].first_offset.has_value());
}

}  // namespace guidscan::scan::test
