#include "tests/folio_test_common.h"
#include "folio/model/visual_crop.h"
#include <limits>

using namespace folio;
using namespace folio_test;

TEST(VisualCropTest, OverCroppedPairScalesProportionally) {
    const VisualCrop crop = normalizeVisualCrop(VisualCrop{0.6, 0.6, 0.0, 0.0});
    EXPECT_NEAR(crop.left, 0.475, kEps);
    EXPECT_NEAR(crop.right, 0.475, kEps);
    EXPECT_DOUBLE_EQ(crop.top, 0.0);
    EXPECT_DOUBLE_EQ(crop.bottom, 0.0);
    expectCropInvariants(crop);
}

TEST(VisualCropTest, ScalingKeepsPairRatio) {
    const VisualCrop crop = normalizeVisualCrop(VisualCrop{0.0, 0.0, 0.9, 0.3});
    EXPECT_NEAR(crop.top + crop.bottom, 0.95, kEps);
    EXPECT_NEAR(crop.top / crop.bottom, 3.0, 1e-9);
    expectCropInvariants(crop);
}

TEST(VisualCropTest, ClampsEachFraction) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const VisualCrop crop = normalizeVisualCrop(VisualCrop{-0.2, nan, 1.5, 0.0});
    EXPECT_DOUBLE_EQ(crop.left, 0.0);
    EXPECT_DOUBLE_EQ(crop.right, 0.0);
    EXPECT_DOUBLE_EQ(crop.top, 0.95);
    EXPECT_DOUBLE_EQ(crop.bottom, 0.0);
    expectCropInvariants(crop);
}

TEST(VisualCropTest, NearZeroCropIsAbsent) {
    EXPECT_FALSE(toOptionalVisualCrop(VisualCrop{0.00001, 0.0, 0.0, 0.00005}).has_value());
    EXPECT_TRUE(toOptionalVisualCrop(VisualCrop{0.1, 0.0, 0.0, 0.0}).has_value());
}

TEST(VisualCropTest, RemainingRatiosAndMultiplier) {
    const VisualCrop crop{0.1, 0.1, 0.2, 0.3};
    const CropRemainingRatios remaining = getVisualCropRemainingRatios(crop);
    EXPECT_NEAR(remaining.widthRatio, 0.8, kEps);
    EXPECT_NEAR(remaining.heightRatio, 0.5, kEps);
    EXPECT_NEAR(getVisualCropAspectRatioMultiplier(&crop), 1.6, kEps);
    EXPECT_DOUBLE_EQ(getVisualCropAspectRatioMultiplier(nullptr), 1.0);
}

TEST(VisualCropTest, BaseRatioRoundTrips) {
    const VisualCrop crop{0.2, 0.0, 0.0, 0.4};
    const double displayed = 1.5;
    const double base = deriveVisualCropBaseAspectRatio(displayed, &crop);
    EXPECT_NEAR(applyVisualCropToAspectRatio(base, &crop), displayed, kEps);
    EXPECT_NEAR(base, 1.5 / (0.8 / 0.6), kEps);
}

TEST(VisualCropTest, SourceRectMapsFractionsToPixels) {
    const VisualCrop crop{0.25, 0.25, 0.1, 0.0};
    const PixelRect rect = getVisualCropSourceRect(400.0, 200.0, &crop);
    EXPECT_DOUBLE_EQ(rect.x, 100.0);
    EXPECT_DOUBLE_EQ(rect.y, 20.0);
    EXPECT_DOUBLE_EQ(rect.width, 200.0);
    EXPECT_DOUBLE_EQ(rect.height, 180.0);

    const PixelRect full = getVisualCropSourceRect(0.0, -5.0, nullptr);
    EXPECT_DOUBLE_EQ(full.width, 1.0);
    EXPECT_DOUBLE_EQ(full.height, 1.0);
}
