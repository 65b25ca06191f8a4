#include "tests/folio_test_common.h"
#include "folio/model/aspect_ratio.h"
#include <cmath>
#include <limits>

using namespace folio;
using namespace folio_test;

TEST(AspectRatioTest, NormalizeClampsFinitePositiveValues) {
    EXPECT_DOUBLE_EQ(normalizeAspectRatio(1.5), 1.5);
    EXPECT_DOUBLE_EQ(normalizeAspectRatio(0.01), 0.05);
    EXPECT_DOUBLE_EQ(normalizeAspectRatio(100.0), 20.0);
}

TEST(AspectRatioTest, NormalizeFallsBackForInvalidValues) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_DOUBLE_EQ(normalizeAspectRatio(nan, 2.0), 2.0);
    EXPECT_DOUBLE_EQ(normalizeAspectRatio(-3.0, 2.0), 2.0);
    EXPECT_DOUBLE_EQ(normalizeAspectRatio(0.0, 50.0), 20.0);
    EXPECT_DOUBLE_EQ(normalizeAspectRatio(0.0, -1.0), 1.0);
    EXPECT_DOUBLE_EQ(normalizeAspectRatio(std::numeric_limits<double>::infinity(), nan), 1.0);
}

TEST(AspectRatioTest, BlockRatioFallsBackToBox) {
    Block block = makeText("t", 0.1, 0.1, 0.4, 0.2);
    block.aspectRatio = std::numeric_limits<double>::quiet_NaN();
    EXPECT_DOUBLE_EQ(getBlockAspectRatio(block), 2.0);

    block.aspectRatio = 0.5;
    EXPECT_DOUBLE_EQ(getBlockAspectRatio(block), 0.5);
}

TEST(AspectRatioTest, SvgViewBoxWins) {
    const auto ratio = parseSvgAspectRatio(R"(<svg width="10" height="10" viewBox="0 0 200 100"></svg>)");
    ASSERT_TRUE(ratio.has_value());
    EXPECT_DOUBLE_EQ(*ratio, 2.0);
}

TEST(AspectRatioTest, SvgViewBoxAcceptsCommas) {
    const auto ratio = parseSvgAspectRatio("<svg viewBox='0,0,30,60'/>");
    ASSERT_TRUE(ratio.has_value());
    EXPECT_DOUBLE_EQ(*ratio, 0.5);
}

TEST(AspectRatioTest, SvgFallsBackToWidthHeight) {
    const auto ratio = parseSvgAspectRatio(R"(<svg width="300px" height="100px"><rect/></svg>)");
    ASSERT_TRUE(ratio.has_value());
    EXPECT_DOUBLE_EQ(*ratio, 3.0);
}

TEST(AspectRatioTest, SvgRejectsPercentAndGarbage) {
    EXPECT_FALSE(parseSvgAspectRatio(R"(<svg width="100%" height="50%"></svg>)").has_value());
    EXPECT_FALSE(parseSvgAspectRatio(R"(<svg viewBox="0 0 10 0"></svg>)").has_value());
    EXPECT_FALSE(parseSvgAspectRatio("<div>not svg</div>").has_value());
    EXPECT_FALSE(parseSvgAspectRatio(R"(<svg width="abc" height="10"></svg>)").has_value());
}

TEST(AspectRatioTest, PixelRatioConvertsToPageUnits) {
    EXPECT_NEAR(imagePixelRatioToBlockRatio(1.0), 1.71 / 1.28, kEps);
    EXPECT_NEAR(imagePixelRatioToBlockRatio(-1.0), 1.71 / 1.28, kEps);
}
