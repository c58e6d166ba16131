// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "utils/string.h" // The file under test.

#include <sstream>

#include <gtest/gtest.h>

// NOLINTBEGIN(*-magic-numbers)
namespace travel
{

/*
 * Fixture to allow parameterized tests for PrecisionedDouble.
 */
class PrecisionedDoubleTest : public testing::TestWithParam<std::pair<double, std::string>>
{
};

TEST_P(PrecisionedDoubleTest, Write)
{
    const auto& [in, expected] = GetParam();

    std::ostringstream ss;
    ss << PrecisionedDouble<3>{ in };
    ASSERT_TRUE(ss.good()) << "The double " << in << " was printed as '" << ss.str() << "' which was a bad string!";
    EXPECT_EQ(ss.str(), expected) << "The double " << in << " was printed wrongly.";
}

INSTANTIATE_TEST_SUITE_P(
    PrecisionedDoubleTestInstantiation,
    PrecisionedDoubleTest,
    testing::Values(
        std::make_pair(0.0, std::string("0")),
        std::make_pair(10.0, std::string("10")),
        std::make_pair(10.5, std::string("10.5")),
        std::make_pair(-2.25, std::string("-2.25")),
        std::make_pair(0.05, std::string("0.05")),
        std::make_pair(1.23456, std::string("1.235")),
        std::make_pair(6000.0, std::string("6000")),
        std::make_pair(-0.0004, std::string("0"))));

TEST(StringTest, ExtruderPrecision)
{
    std::ostringstream ss;
    ss << PrecisionedDouble<5>{ 1.234567 };
    EXPECT_EQ(ss.str(), "1.23457");
}

TEST(StringTest, Trim)
{
    EXPECT_EQ(trim("  G1 X1\t\r\n"), "G1 X1");
    EXPECT_EQ(trim("G1"), "G1");
    EXPECT_EQ(trim(" \t "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(StringTest, CaseCompare)
{
    EXPECT_EQ(stringcasecompare("help", "HELP"), 0);
    EXPECT_LT(stringcasecompare("abc", "abd"), 0);
    EXPECT_GT(stringcasecompare("abcd", "abc"), 0);
}

} // namespace travel
// NOLINTEND(*-magic-numbers)
