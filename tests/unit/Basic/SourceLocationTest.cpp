/// \file SourceLocationTest.cpp
/// \brief Unit tests for SourceLocation and SourceRange.

#include "machlink/Basic/SourceLocation.h"
#include <gtest/gtest.h>

namespace machlink {
namespace {

// ============================================================================
// SourceLocation Tests
// ============================================================================

TEST(SourceLocationTest, DefaultConstructorCreatesInvalidLocation) {
    SourceLocation loc;
    EXPECT_TRUE(loc.isInvalid());
    EXPECT_FALSE(loc.isValid());
    EXPECT_EQ(loc.getOffset(), 0u);
}

TEST(SourceLocationTest, ZeroOffsetIsInvalid) {
    EXPECT_TRUE(SourceLocation(0).isInvalid());
    EXPECT_TRUE(SourceLocation(42).isValid());
}

TEST(SourceLocationTest, Comparison) {
    SourceLocation loc1(10);
    SourceLocation loc2(20);

    EXPECT_EQ(loc1, SourceLocation(10));
    EXPECT_NE(loc1, loc2);
    EXPECT_TRUE(loc1 < loc2);
    EXPECT_FALSE(loc2 < loc1);
}

TEST(SourceLocationTest, OffsetKeepsInvalidLocationsInvalid) {
    EXPECT_EQ(SourceLocation(10).getLocWithOffset(5).getOffset(), 15u);
    EXPECT_TRUE(SourceLocation().getLocWithOffset(5).isInvalid());
}

// ============================================================================
// SourceRange Tests
// ============================================================================

TEST(SourceRangeTest, DefaultRangeIsInvalid) {
    SourceRange range;
    EXPECT_FALSE(range.isValid());
}

TEST(SourceRangeTest, SingleLocationRange) {
    SourceLocation loc(7);
    SourceRange range(loc);
    EXPECT_TRUE(range.isValid());
    EXPECT_EQ(range.getBegin(), loc);
    EXPECT_EQ(range.getEnd(), loc);
}

TEST(SourceRangeTest, RangeNeedsBothEnds) {
    EXPECT_FALSE(SourceRange(SourceLocation(1), SourceLocation()).isValid());

    SourceRange range(SourceLocation(1), SourceLocation(4));
    range.setEnd(SourceLocation(9));
    EXPECT_EQ(range.getEnd().getOffset(), 9u);
    EXPECT_EQ(range, SourceRange(SourceLocation(1), SourceLocation(9)));
    EXPECT_NE(range, SourceRange(SourceLocation(1)));
}

} // namespace
} // namespace machlink
