/**
 * @file range_expr_tests.cpp
 * @brief Unit tests for integer range expressions.
 */
#include <gtest/gtest.h>
#include <limits>
#include "jobtmpl/expansion/range_expr.hpp"

using namespace jobtmpl;

// ============================================================================
// Parsing and values
// ============================================================================

TEST(IntRangeExprTests, SingleValue)
{
    auto expr = IntRangeExpr::parse("7");
    EXPECT_EQ(expr.values(), (std::vector<int64_t>{7}));
}

TEST(IntRangeExprTests, SimpleRange_DefaultStep)
{
    EXPECT_EQ(IntRangeExpr::parse("1-5").values(), (std::vector<int64_t>{1, 2, 3, 4, 5}));
}

TEST(IntRangeExprTests, SteppedRange_StopsAtOrBeforeEnd)
{
    EXPECT_EQ(IntRangeExpr::parse("1-10:4").values(), (std::vector<int64_t>{1, 5, 9}));
}

TEST(IntRangeExprTests, SteppedRange_WithExtra)
{
    auto values = IntRangeExpr::parse("11-380:11,380").values();
    ASSERT_EQ(values.size(), 35u);
    EXPECT_EQ(values.front(), 11);
    EXPECT_EQ(values[33], 374);
    EXPECT_EQ(values.back(), 380);
}

TEST(IntRangeExprTests, NegativeBounds)
{
    EXPECT_EQ(IntRangeExpr::parse("-5--1:2").values(), (std::vector<int64_t>{-5, -3, -1}));
}

TEST(IntRangeExprTests, MultipleComponents_WhitespaceIgnored)
{
    EXPECT_EQ(IntRangeExpr::parse(" 1 - 3 , 10 , 20-22 ").values(),
              (std::vector<int64_t>{1, 2, 3, 10, 20, 21, 22}));
}

TEST(IntRangeExprTests, Size_MatchesValues)
{
    auto expr = IntRangeExpr::parse("1-380:11");
    EXPECT_EQ(expr.size(), expr.values().size());
    EXPECT_EQ(expr.components().front().last(), 375);
}

// Every value lies in [start, end], the sequence increases strictly, and the
// last value is the largest start + k*step not exceeding end.
TEST(IntRangeExprTests, SteppedRange_Properties)
{
    for (int64_t start : {-7, 0, 3})
    {
        for (int64_t end : {start + 1, start + 10, start + 97})
        {
            for (int64_t step : {1, 2, 3, 11})
            {
                const std::string text = std::to_string(start) + "-" + std::to_string(end) + ":" +
                                         std::to_string(step);
                auto values = IntRangeExpr::parse(text).values();
                ASSERT_FALSE(values.empty()) << text;
                EXPECT_EQ(values.front(), start) << text;
                for (size_t i = 1; i < values.size(); ++i)
                {
                    EXPECT_EQ(values[i] - values[i - 1], step) << text;
                }
                EXPECT_LE(values.back(), end) << text;
                EXPECT_GT(values.back() + step, end) << text;
            }
        }
    }
}

// ============================================================================
// Errors
// ============================================================================

TEST(IntRangeExprTests, Empty_Throws)
{
    EXPECT_THROW(IntRangeExpr::parse(""), RangeExpansionError);
    EXPECT_THROW(IntRangeExpr::parse("   "), RangeExpansionError);
}

TEST(IntRangeExprTests, NonIncreasingBounds_Throws)
{
    EXPECT_THROW(IntRangeExpr::parse("5-1"), RangeExpansionError);
    EXPECT_THROW(IntRangeExpr::parse("5-5"), RangeExpansionError);
}

TEST(IntRangeExprTests, NonPositiveStep_Throws)
{
    EXPECT_THROW(IntRangeExpr::parse("1-10:0"), RangeExpansionError);
    EXPECT_THROW(IntRangeExpr::parse("1-10:-2"), RangeExpansionError);
}

TEST(IntRangeExprTests, ExtraOutOfOrder_Throws)
{
    // Last stepped value is 9; 9 and anything below are out of order
    EXPECT_THROW(IntRangeExpr::parse("1-10:4,9"), RangeExpansionError);
    EXPECT_THROW(IntRangeExpr::parse("1-10:4,2"), RangeExpansionError);
    EXPECT_NO_THROW(IntRangeExpr::parse("1-10:4,10"));
}

TEST(IntRangeExprTests, StepWithoutRange_Throws)
{
    EXPECT_THROW(IntRangeExpr::parse("3:2"), RangeExpansionError);
}

TEST(IntRangeExprTests, TrailingText_Throws)
{
    EXPECT_THROW(IntRangeExpr::parse("1-3 x"), RangeExpansionError);
    EXPECT_THROW(IntRangeExpr::parse("1-3,"), RangeExpansionError);
}

TEST(IntRangeExprTests, TooManyValues_Throws)
{
    EXPECT_THROW(IntRangeExpr::parse("0-100000000"), RangeExpansionError);
}

TEST(IntRangeExprTests, FullInt64Span_Throws)
{
    EXPECT_THROW(IntRangeExpr::parse("-9223372036854775808-9223372036854775807"),
                 RangeExpansionError);
    EXPECT_THROW(IntRangeExpr::parse("-9223372036854775808--1:1"), RangeExpansionError);
}

TEST(IntRangeExprTests, Size_SaturatesInsteadOfWrapping)
{
    IntRangeComponent component;
    component.start = std::numeric_limits<int64_t>::min();
    component.end = std::numeric_limits<int64_t>::max();
    component.step = 1;
    EXPECT_EQ(component.size(), std::numeric_limits<size_t>::max());
    EXPECT_EQ(component.last(), std::numeric_limits<int64_t>::max());
}

TEST(IntRangeExprTests, ErrorMessage_NamesExpression)
{
    try
    {
        IntRangeExpr::parse("9-1");
        FAIL() << "Expected RangeExpansionError";
    }
    catch (const RangeExpansionError& e)
    {
        EXPECT_NE(std::string(e.what()).find("'9-1'"), std::string::npos);
    }
}
