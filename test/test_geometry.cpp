#include <gtest/gtest.h>
#include "geodna/geodna.hpp"
#include "geodna/geometry.hpp"

#include <stdexcept>
#include <string>
#include <vector>

// The rectangle of "etc" and its western half.
static const std::string ETC_WKT = "POLYGON((135 -45, 180 -45, 180 0, 135 0, 135 -45))";
static const std::string ETC_WEST_WKT = "POLYGON((135 -45, 157.5 -45, 157.5 0, 135 0, 135 -45))";

TEST(WktTest, BoundingBox) {
    EXPECT_EQ(geodna::boundingBoxWkt("etc"), "POLYGON((135 -45, 180 -45, 180 0, 135 0, 135 -45))");
}

TEST(WktTest, Point) {
    EXPECT_EQ(geodna::pointWkt("etc"), "POINT(157.5 -22.5)");
    EXPECT_THROW(geodna::pointWkt("x"), geodna::InvalidCodeException);
}

TEST(AreaRatioTest, ContainedAndDisjoint) {
    EXPECT_DOUBLE_EQ(geodna::areaRatio("etcg", "etc"), 1.0);
    EXPECT_DOUBLE_EQ(geodna::areaRatio("etc", "etcg"), 0.25);
    EXPECT_DOUBLE_EQ(geodna::areaRatio("etc", "wg"), 0.0);
}

TEST(PolyfillTest, CellRectangle) {
    std::vector<std::string> expected = {"etcg", "etca", "etct", "etcc"};
    std::vector<std::string> codes = geodna::polyfill(ETC_WKT, 4);
    EXPECT_EQ(codes, expected);

    std::vector<std::string> reduced = geodna::reduce(codes);
    ASSERT_EQ(reduced.size(), 1u);
    EXPECT_EQ(reduced[0], "etc");
}

TEST(PolyfillTest, PartialCells) {
    // Exactly half of "etc" is covered: kept only in full mode.
    EXPECT_TRUE(geodna::polyfill(ETC_WEST_WKT, 3).empty());
    std::vector<std::string> full = geodna::polyfill(ETC_WEST_WKT, 3, true);
    ASSERT_EQ(full.size(), 1u);
    EXPECT_EQ(full[0], "etc");

    std::vector<std::string> expected = {"etcg", "etca"};
    EXPECT_EQ(geodna::polyfill(ETC_WEST_WKT, 4), expected);
}

TEST(PolyfillTest, RejectsBadInput) {
    EXPECT_THROW(geodna::polyfill("POLYGON((", 5), geodna::InvalidInputException);
    EXPECT_THROW(geodna::polyfill(ETC_WKT, 0), geodna::InvalidPrecisionException);
    EXPECT_THROW(geodna::polyfill(ETC_WKT, 22), std::out_of_range);
}
