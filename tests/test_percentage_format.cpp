#include "consolebar/bar/percentage_format.hpp"
#include <gtest/gtest.h>
#include <limits>

using consolebar::bar::formatPercentage;

TEST(PercentageFormatTest, DefaultPatternRoundsToWholePercent) {
    EXPECT_EQ(formatPercentage(0.0, "0%"), "0%");
    EXPECT_EQ(formatPercentage(0.35, "0%"), "35%");
    EXPECT_EQ(formatPercentage(0.355, "0%"), "36%");
    EXPECT_EQ(formatPercentage(1.0, "0%"), "100%");
    EXPECT_EQ(formatPercentage(1.5, "0%"), "150%");
}

TEST(PercentageFormatTest, FractionPlaceholders) {
    EXPECT_EQ(formatPercentage(0.1234, "0.0%"), "12.3%");
    EXPECT_EQ(formatPercentage(0.5, "0.00%"), "50.00%");
    EXPECT_EQ(formatPercentage(0.5, "#.##%"), "50%");
    EXPECT_EQ(formatPercentage(0.1234, "#.##%"), "12.34%");
    EXPECT_EQ(formatPercentage(0.5, "0.###"), "0.5");
}

TEST(PercentageFormatTest, StandardSpecifiers) {
    EXPECT_EQ(formatPercentage(0.5, "P"), "50.00 %");
    EXPECT_EQ(formatPercentage(0.1234, "P1"), "12.3 %");
    EXPECT_EQ(formatPercentage(0.1234, "p0"), "12 %");
    EXPECT_EQ(formatPercentage(0.5, "F2"), "0.50");
    EXPECT_EQ(formatPercentage(1234.5, "N0"), "1,235");
    EXPECT_EQ(formatPercentage(0.25, "G"), "0.25");
}

TEST(PercentageFormatTest, GroupingAndScaling) {
    EXPECT_EQ(formatPercentage(1234567.0, "#,##0"), "1,234,567");
    EXPECT_EQ(formatPercentage(1500.0, "0,"), "2");
}

TEST(PercentageFormatTest, NegativeValuesAndSections) {
    EXPECT_EQ(formatPercentage(-0.25, "0%"), "-25%");
    EXPECT_EQ(formatPercentage(-0.25, "0%;(0%)"), "(25%)");
    EXPECT_EQ(formatPercentage(-0.001, "0%"), "0%");
    EXPECT_EQ(formatPercentage(0.0, "0%;-0%;none"), "none");
}

TEST(PercentageFormatTest, LiteralsAndEscapes) {
    EXPECT_EQ(formatPercentage(0.5, "'done '0%"), "done 50%");
    EXPECT_EQ(formatPercentage(0.5, "\"at \"0%"), "at 50%");
    EXPECT_EQ(formatPercentage(0.5, "0\\%"), "1%");
    EXPECT_EQ(formatPercentage(0.5, "0\xE2\x80\xB0"), "500\xE2\x80\xB0");
    EXPECT_EQ(formatPercentage(0.5, "abc"), "abc");
}

TEST(PercentageFormatTest, NonFiniteValues) {
    EXPECT_EQ(formatPercentage(std::numeric_limits<double>::quiet_NaN(), "0%"), "NaN");
    EXPECT_EQ(formatPercentage(std::numeric_limits<double>::infinity(), "0%"), "Infinity");
}
