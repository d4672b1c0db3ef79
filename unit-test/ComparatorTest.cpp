#include "gtest/gtest.h"
#include "judge/comparator.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;

TEST(ComparatorTest, ExactMatchIsByteForByte) {
    EXPECT_TRUE(compare_exact("1 2\n", "1 2\n"));
    EXPECT_FALSE(compare_exact("1 2", "1 2\n"));
    EXPECT_FALSE(compare_exact("1 2\r\n", "1 2\n"));
}

TEST(ComparatorTest, TrimIgnoresTrailingWhitespaceAndBlankLines) {
    EXPECT_TRUE(compare_trimmed("1 2  \r\n3\t\n\n\n", "1 2\n3"));
    EXPECT_TRUE(compare_trimmed("", "\n\n"));
    EXPECT_FALSE(compare_trimmed(" 1 2\n3", "1 2\n3"));
    EXPECT_FALSE(compare_trimmed("1 2\n", "1 2\n3\n"));
    EXPECT_FALSE(compare_trimmed("1\n\n2", "1\n2"));
}

TEST(ComparatorTest, TokensIgnoreLayout) {
    EXPECT_TRUE(compare_tokens("1\n2   3\n", "1 2 3", nullopt, nullopt));
    EXPECT_FALSE(compare_tokens("1 2", "1 2 3", nullopt, nullopt));
    EXPECT_FALSE(compare_tokens("1.0", "1", nullopt, nullopt));
}

TEST(ComparatorTest, TokensWithAbsoluteTolerance) {
    EXPECT_TRUE(compare_tokens("0.3333", "0.33333333", 1e-3, nullopt));
    EXPECT_FALSE(compare_tokens("0.3333", "0.33333333", 1e-6, nullopt));
    EXPECT_TRUE(compare_tokens("1.0 yes", "1 yes", 0.0, nullopt));
}

TEST(ComparatorTest, TokensWithRelativeTolerance) {
    EXPECT_TRUE(compare_tokens("1000001", "1000000", nullopt, 1e-5));
    EXPECT_FALSE(compare_tokens("1001", "1000", nullopt, 1e-5));
}

TEST(ComparatorTest, NonNumericTokensCompareExactly) {
    EXPECT_FALSE(compare_tokens("abc", "abd", 1.0, 1.0));
    EXPECT_FALSE(compare_tokens("1x", "1", 1.0, nullopt));
    EXPECT_FALSE(compare_tokens("inf", "1e308", 1e308, nullopt));
}

TEST(ComparatorTest, CompareOutputFollowsMode) {
    EXPECT_EQ(compare_output("2 \n", *fixtures::make_test("", "2", comparison_mode::TRIM)), verdict::PASS);
    EXPECT_EQ(compare_output("2 \n", *fixtures::make_test("", "2", comparison_mode::EXACT)), verdict::WRONG_ANSWER);
    EXPECT_EQ(compare_output("2\n3", *fixtures::make_test("", "2 3", comparison_mode::TOKENS)), verdict::PASS);
    EXPECT_THROW(compare_output("2", *fixtures::make_test("", "2", comparison_mode::CHECKER)), logic_error);
}
