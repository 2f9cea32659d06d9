/**
 * @file test_filter_request.cpp
 * @brief Unit tests for Pipeline/FilterRequest.h and Pipeline/KernelDispatch.h
 */

#include <PixKit/Pipeline/FilterRequest.h>
#include <PixKit/Pipeline/KernelDispatch.h>
#include <PixKit/Core/Exception.h>
#include <PixKit/Filter/Filter.h>
#include <PixKit/IO/ImageCodec.h>
#include <PixKit/Platform/Log.h>
#include <gtest/gtest.h>

#include <limits>
#include <string>

using namespace Pix::Kit;
using namespace Pix::Kit::Pipeline;

class FilterRequestTest : public ::testing::Test {
protected:
    PixelBuffer MakeImage() {
        PixelBuffer img(8, 6);
        for (int32_t y = 0; y < 6; ++y) {
            for (int32_t x = 0; x < 8; ++x) {
                img.SetAt(x, y, Rgba8(static_cast<uint8_t>(x * 30), static_cast<uint8_t>(y * 40),
                                      90, 255));
            }
        }
        return img;
    }
};

// ============================================================================
// Kinds and Names
// ============================================================================

TEST_F(FilterRequestTest, KindFollowsParams) {
    EXPECT_EQ(FilterRequest(GrayscaleParams{}).Kind(), FilterKind::Grayscale);
    EXPECT_EQ(FilterRequest(OilPaintingParams{}).Kind(), FilterKind::OilPainting);
    EXPECT_EQ(FilterRequest(DrawDetectionsParams{}).Kind(), FilterKind::DrawDetections);
    EXPECT_EQ(FilterRequest().Kind(), FilterKind::Grayscale);
}

TEST_F(FilterRequestTest, OperationNames) {
    EXPECT_EQ(FilterRequest(BlurParams{}).Name(), "applyBlur");
    EXPECT_EQ(FilterRequest(BrightnessParams{}).Name(), "adjustBrightness");
    EXPECT_STREQ(GetOperationName(FilterKind::Watermark), "applyWatermark");
    EXPECT_STREQ(GetStageName(FilterKind::OilPainting), "oil_painting");
}

TEST_F(FilterRequestTest, TypedAccess) {
    FilterRequest r(CropParams{1, 2, 3, 4});
    ASSERT_NE(r.Get<CropParams>(), nullptr);
    EXPECT_EQ(r.Get<CropParams>()->height, 4);
    EXPECT_EQ(r.Get<BlurParams>(), nullptr);
}

TEST_F(FilterRequestTest, DefaultParameters) {
    EXPECT_DOUBLE_EQ(BlurParams{}.sigma, 5.0);
    EXPECT_DOUBLE_EQ(VignetteParams{}.intensity, 0.5);
    EXPECT_EQ(WatercolorParams{}.radius, 5);
    EXPECT_EQ(OilPaintingParams{}.levels, 20);
    EXPECT_DOUBLE_EQ(WatermarkParams{}.opacity, 1.0);
}

TEST_F(FilterRequestTest, OnlyWatermarkPrefersPng) {
    EXPECT_TRUE(FilterRequest(WatermarkParams{}).PrefersPng());
    EXPECT_FALSE(FilterRequest(GrayscaleParams{}).PrefersPng());
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(FilterRequestTest, ValidateRejectsBadParameters) {
    EXPECT_THROW(FilterRequest(BrightnessParams{2.0}).Validate(), InvalidArgumentException);
    EXPECT_THROW(FilterRequest(BlurParams{-1.0}).Validate(), InvalidArgumentException);
    EXPECT_THROW(FilterRequest(OilPaintingParams{4, 0}).Validate(), InvalidArgumentException);
    EXPECT_THROW(FilterRequest(ResizeParams{}).Validate(), InvalidArgumentException);
    EXPECT_THROW(FilterRequest(ResizeParams{0, 10}).Validate(), InvalidArgumentException);
    EXPECT_THROW(FilterRequest(CropParams{0, 0, 0, 5}).Validate(), InvalidArgumentException);
    EXPECT_THROW(FilterRequest(WatermarkParams{{}, 0, 0, 1.5}).Validate(),
                 InvalidArgumentException);
    EXPECT_THROW(FilterRequest(RotateParams{std::numeric_limits<double>::infinity()}).Validate(),
                 InvalidArgumentException);
}

TEST_F(FilterRequestTest, ValidateAcceptsDefaults) {
    EXPECT_NO_THROW(FilterRequest(BlurParams{}).Validate());
    EXPECT_NO_THROW(FilterRequest(ResizeParams{50, std::nullopt}).Validate());
    EXPECT_NO_THROW(FilterRequest(CropParams{10, 10, 50, 50}).Validate());
    EXPECT_NO_THROW(FilterRequest(FlipParams{true, false}).Validate());
}

// ============================================================================
// Accelerator Parameters
// ============================================================================

TEST_F(FilterRequestTest, ParamMapCarriesValues) {
    Accel::ParamMap blur = FilterRequest(BlurParams{2.5}).ToParamMap();
    EXPECT_DOUBLE_EQ(std::get<double>(blur.at("sigma")), 2.5);

    Accel::ParamMap crop = FilterRequest(CropParams{1, 2, 3, 4}).ToParamMap();
    EXPECT_EQ(std::get<int64_t>(crop.at("width")), 3);

    Accel::ParamMap flip = FilterRequest(FlipParams{false, true}).ToParamMap();
    EXPECT_TRUE(std::get<bool>(flip.at("vertical")));

    EXPECT_TRUE(FilterRequest(SepiaParams{}).ToParamMap().empty());
}

TEST_F(FilterRequestTest, ResizeParamMapOmitsMissingDimension) {
    Accel::ParamMap map = FilterRequest(ResizeParams{std::nullopt, 40}).ToParamMap();
    EXPECT_EQ(map.count("width"), 0u);
    EXPECT_EQ(std::get<int64_t>(map.at("height")), 40);
}

// ============================================================================
// Kernel Dispatch
// ============================================================================

TEST_F(FilterRequestTest, DispatchMatchesDirectKernel) {
    PixelBuffer img = MakeImage();
    PixelBuffer viaRequest, direct;

    ApplyKernel(img, viaRequest, FilterRequest(OilPaintingParams{2, 8}));
    Filter::OilPainting(img, direct, 2, 8);
    EXPECT_EQ(viaRequest, direct);

    ApplyKernel(img, viaRequest, FilterRequest(VignetteParams{0.8, 0.7}));
    Filter::Vignette(img, direct, 0.8, 0.7);
    EXPECT_EQ(viaRequest, direct);
}

TEST_F(FilterRequestTest, DispatchGeometry) {
    PixelBuffer img = MakeImage();
    PixelBuffer out;
    ApplyKernel(img, out, FilterRequest(RotateParams{90.0}));
    EXPECT_EQ(out.Width(), 6);
    EXPECT_EQ(out.Height(), 8);

    ApplyKernel(img, out, FilterRequest(ResizeParams{4, std::nullopt}));
    EXPECT_EQ(out.Width(), 4);
    EXPECT_EQ(out.Height(), 3);
}

TEST_F(FilterRequestTest, DispatchWatermarkDecodesMark) {
    PixelBuffer img(4, 4, Rgba8(0, 0, 0, 255));
    WatermarkParams p;
    p.watermark = IO::EncodeImage(PixelBuffer(2, 2, Rgba8(255, 255, 255, 255)), IO::ImageFormat::PNG);
    p.x = 1;
    p.y = 1;
    PixelBuffer out;
    ApplyKernel(img, out, FilterRequest(p));
    EXPECT_EQ(out.At(1, 1), Rgba8(255, 255, 255, 255));
    EXPECT_EQ(out.At(0, 0), Rgba8(0, 0, 0, 255));
}

TEST_F(FilterRequestTest, UndecodableWatermarkLeavesImage) {
    Platform::LogLevel saved = Platform::GetLogLevel();
    Platform::SetLogLevel(Platform::LogLevel::Off);

    PixelBuffer img = MakeImage();
    WatermarkParams p;
    p.watermark = {1, 2, 3};
    PixelBuffer out;
    ApplyKernel(img, out, FilterRequest(p));
    EXPECT_EQ(out, img);

    // Opacity is still checked
    p.opacity = 3.0;
    EXPECT_THROW(ApplyKernel(img, out, FilterRequest(p)), InvalidArgumentException);

    Platform::SetLogLevel(saved);
}
