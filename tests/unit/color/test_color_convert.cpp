/**
 * @file test_color_convert.cpp
 * @brief Unit tests for Color/ColorConvert.h
 */

#include <PixKit/Color/ColorConvert.h>
#include <gtest/gtest.h>

#include <cstdlib>

using namespace Pix::Kit;
using namespace Pix::Kit::Color;

class ColorConvertTest : public ::testing::Test {
protected:
    static constexpr double TOL = 1e-9;

    void ExpectRoundTrip(uint8_t r, uint8_t g, uint8_t b) {
        uint8_t r2 = 0, g2 = 0, b2 = 0;
        HslToRgb(RgbToHsl(r, g, b), r2, g2, b2);
        EXPECT_LE(std::abs(r - r2), 1) << int(r) << "," << int(g) << "," << int(b);
        EXPECT_LE(std::abs(g - g2), 1) << int(r) << "," << int(g) << "," << int(b);
        EXPECT_LE(std::abs(b - b2), 1) << int(r) << "," << int(g) << "," << int(b);
    }
};

// ============================================================================
// Luminance
// ============================================================================

TEST_F(ColorConvertTest, LuminanceOfPrimaries) {
    EXPECT_NEAR(Luminance(255, 0, 0), 76.245, TOL);
    EXPECT_NEAR(Luminance(0, 255, 0), 149.685, TOL);
    EXPECT_NEAR(Luminance(0, 0, 255), 29.07, TOL);
    EXPECT_NEAR(Luminance(Rgba8(255, 255, 255, 0)), 255.0, TOL);
}

// ============================================================================
// HSL
// ============================================================================

TEST_F(ColorConvertTest, PureRedHsl) {
    Hsl hsl = RgbToHsl(255, 0, 0);
    EXPECT_NEAR(hsl.h, 0.0, TOL);
    EXPECT_NEAR(hsl.s, 1.0, TOL);
    EXPECT_NEAR(hsl.l, 0.5, TOL);
}

TEST_F(ColorConvertTest, HueSectors) {
    EXPECT_NEAR(RgbToHsl(0, 255, 0).h, 120.0, TOL);
    EXPECT_NEAR(RgbToHsl(0, 0, 255).h, 240.0, TOL);
    EXPECT_NEAR(RgbToHsl(255, 0, 255).h, 300.0, TOL);
}

TEST_F(ColorConvertTest, GrayIsAchromatic) {
    Hsl hsl = RgbToHsl(128, 128, 128);
    EXPECT_DOUBLE_EQ(hsl.s, 0.0);
    EXPECT_DOUBLE_EQ(hsl.h, 0.0);

    uint8_t r = 0, g = 0, b = 0;
    HslToRgb(hsl, r, g, b);
    EXPECT_EQ(r, 128);
    EXPECT_EQ(g, 128);
    EXPECT_EQ(b, 128);
}

TEST_F(ColorConvertTest, RoundTripSamples) {
    ExpectRoundTrip(255, 0, 0);
    ExpectRoundTrip(12, 200, 99);
    ExpectRoundTrip(250, 240, 5);
    ExpectRoundTrip(1, 2, 3);
    ExpectRoundTrip(0, 0, 0);
    ExpectRoundTrip(255, 255, 255);
}

TEST_F(ColorConvertTest, OversaturatedClamps) {
    Hsl hsl{30.0, 2.5, 0.5};
    uint8_t r = 0, g = 0, b = 0;
    HslToRgb(hsl, r, g, b);
    EXPECT_EQ(r, 255);
    EXPECT_EQ(b, 0);
}

TEST_F(ColorConvertTest, NegativeHueWraps) {
    uint8_t r1 = 0, g1 = 0, b1 = 0, r2 = 0, g2 = 0, b2 = 0;
    HslToRgb(Hsl{-120.0, 1.0, 0.5}, r1, g1, b1);
    HslToRgb(Hsl{240.0, 1.0, 0.5}, r2, g2, b2);
    EXPECT_EQ(r1, r2);
    EXPECT_EQ(g1, g2);
    EXPECT_EQ(b1, b2);
}
