/**
 * @file test_filter_pipeline.cpp
 * @brief Unit tests for Pipeline/FilterPipeline.h
 */

#include <PixKit/Pipeline/FilterPipeline.h>
#include <PixKit/Core/Exception.h>
#include <PixKit/Filter/Filter.h>
#include <PixKit/Platform/Log.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace Pix::Kit;
using namespace Pix::Kit::Pipeline;

class FilterPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        savedLevel_ = Platform::GetLogLevel();
        Platform::SetLogLevel(Platform::LogLevel::Warning);
        Platform::SetLogSink([this](Platform::LogLevel level, const std::string& tag,
                                    const std::string& message) {
            if (level >= Platform::LogLevel::Warning) {
                logged_.push_back(tag + ": " + message);
            }
        });
    }

    void TearDown() override {
        Platform::SetLogSink(nullptr);
        Platform::SetLogLevel(savedLevel_);
    }

    Platform::LogLevel savedLevel_ = Platform::LogLevel::Warning;

    PixelBuffer MakeImage(int32_t w = 16, int32_t h = 12) {
        PixelBuffer img(w, h);
        for (int32_t y = 0; y < h; ++y) {
            for (int32_t x = 0; x < w; ++x) {
                img.SetAt(x, y, Rgba8(static_cast<uint8_t>(x * 15), static_cast<uint8_t>(y * 20),
                                      60, 255));
            }
        }
        return img;
    }

    std::vector<std::string> logged_;
};

// ============================================================================
// Buffer Pipeline
// ============================================================================

TEST_F(FilterPipelineTest, EmptyPipelineIsIdentity) {
    FilterPipeline pipeline;
    EXPECT_TRUE(pipeline.Empty());
    PixelBuffer img = MakeImage();
    PixelBuffer out;
    pipeline.Run(img, out);
    EXPECT_EQ(out, img);
}

TEST_F(FilterPipelineTest, StagesRunInOrder) {
    FilterPipeline pipeline;
    pipeline.Add(InvertParams{}).Add(GrayscaleParams{});
    EXPECT_EQ(pipeline.Size(), 2u);

    PixelBuffer img = MakeImage();
    PixelBuffer expected, tmp, out;
    Filter::Invert(img, tmp);
    Filter::Grayscale(tmp, expected);

    pipeline.Run(img, out);
    EXPECT_EQ(out, expected);
}

TEST_F(FilterPipelineTest, GeometryChangesSizeMidChain) {
    FilterPipeline pipeline({CropParams{2, 2, 10, 6}, RotateParams{90.0}});
    PixelBuffer out;
    pipeline.Run(MakeImage(), out);
    EXPECT_EQ(out.Width(), 6);
    EXPECT_EQ(out.Height(), 10);
}

TEST_F(FilterPipelineTest, ValidationHappensBeforeAnyStage) {
    FilterPipeline pipeline({GrayscaleParams{}, BrightnessParams{5.0}});
    PixelBuffer out(1, 1);
    EXPECT_THROW(pipeline.Run(MakeImage(), out), InvalidArgumentException);
    // Output untouched
    EXPECT_EQ(out.Width(), 1);
    ASSERT_FALSE(logged_.empty());
    EXPECT_NE(logged_.back().find("stage 1 (brightness)"), std::string::npos);
}

TEST_F(FilterPipelineTest, StageFailureNamesStage) {
    FilterPipeline pipeline({ResizeParams{4, 4}, CropParams{0, 0, 8, 8}});
    PixelBuffer out;
    EXPECT_THROW(pipeline.Run(MakeImage(), out), InvalidArgumentException);
    ASSERT_FALSE(logged_.empty());
    EXPECT_NE(logged_.back().find("stage 1 (crop) failed"), std::string::npos);
}

// ============================================================================
// Encoded Pipeline
// ============================================================================

TEST_F(FilterPipelineTest, UndecodableInputReturnedUnchanged) {
    FilterPipeline pipeline({GrayscaleParams{}});
    EncodedImage garbage{0, 1, 2, 3};
    EXPECT_EQ(pipeline.Run(garbage), garbage);
    EXPECT_FALSE(logged_.empty());
}

TEST_F(FilterPipelineTest, EncodedRunHonoursFormat) {
    FilterPipeline pipeline({GrayscaleParams{}});
    EncodedImage png = IO::EncodeImage(MakeImage(), IO::ImageFormat::PNG);

    EncodedImage jpeg = pipeline.Run(png);
    EXPECT_EQ(IO::DetectFormat(jpeg), IO::ImageFormat::JPEG);

    EncodeOptions options;
    options.format = IO::ImageFormat::PNG;
    EncodedImage out = pipeline.Run(png, options);
    ASSERT_EQ(IO::DetectFormat(out), IO::ImageFormat::PNG);

    PixelBuffer expected;
    Filter::Grayscale(MakeImage(), expected);
    EXPECT_EQ(IO::DecodeImage(out), expected);
}

TEST_F(FilterPipelineTest, WatermarkStageDefaultsToPng) {
    WatermarkParams mark;
    mark.watermark = IO::EncodeImage(PixelBuffer(2, 2, Rgba8(1, 2, 3, 128)), IO::ImageFormat::PNG);
    FilterPipeline pipeline({GrayscaleParams{}, mark});
    EXPECT_TRUE(pipeline.PrefersPng());

    EncodedImage out = pipeline.Run(IO::EncodeImage(MakeImage(), IO::ImageFormat::JPEG));
    EXPECT_EQ(IO::DetectFormat(out), IO::ImageFormat::PNG);
}

// ============================================================================
// Chain Parsing
// ============================================================================

TEST_F(FilterPipelineTest, ParseChain) {
    FilterPipeline p = ParseFilterChain("grayscale | blur:sigma=2.5 | resize:width=50 | oil:radius=3");
    ASSERT_EQ(p.Size(), 4u);
    EXPECT_EQ(p.Stages()[0].Kind(), FilterKind::Grayscale);
    EXPECT_DOUBLE_EQ(p.Stages()[1].Get<BlurParams>()->sigma, 2.5);
    EXPECT_EQ(p.Stages()[2].Get<ResizeParams>()->width, 50);
    EXPECT_FALSE(p.Stages()[2].Get<ResizeParams>()->height.has_value());
    EXPECT_EQ(p.Stages()[3].Get<OilPaintingParams>()->radius, 3);
    EXPECT_EQ(p.Stages()[3].Get<OilPaintingParams>()->levels, 20);
}

TEST_F(FilterPipelineTest, ParseDefaultsAndAliases) {
    FilterRequest blur = ParseFilterStage("BLUR");
    EXPECT_DOUBLE_EQ(blur.Get<BlurParams>()->sigma, 5.0);
    EXPECT_EQ(ParseFilterStage("gray").Kind(), FilterKind::Grayscale);
    EXPECT_EQ(ParseFilterStage("oil_painting").Kind(), FilterKind::OilPainting);
}

TEST_F(FilterPipelineTest, ParseFlipForms) {
    const FlipParams* a = nullptr;
    FilterRequest r1 = ParseFilterStage("flip:mode=both");
    a = r1.Get<FlipParams>();
    EXPECT_TRUE(a->horizontal);
    EXPECT_TRUE(a->vertical);

    FilterRequest r2 = ParseFilterStage("flip:horizontal=true");
    EXPECT_TRUE(r2.Get<FlipParams>()->horizontal);
    EXPECT_FALSE(r2.Get<FlipParams>()->vertical);
}

TEST_F(FilterPipelineTest, ParseCropAndRotate) {
    FilterRequest crop = ParseFilterStage("crop:x=10,y=10,width=50,height=50");
    EXPECT_EQ(crop.Get<CropParams>()->x, 10);
    EXPECT_EQ(crop.Get<CropParams>()->height, 50);
    FilterRequest rot = ParseFilterStage("rotate:angle=-45");
    EXPECT_DOUBLE_EQ(rot.Get<RotateParams>()->degrees, -45.0);
}

TEST_F(FilterPipelineTest, ParseErrors) {
    EXPECT_THROW(ParseFilterChain(""), InvalidArgumentException);
    EXPECT_THROW(ParseFilterChain("grayscale||sepia"), InvalidArgumentException);
    EXPECT_THROW(ParseFilterStage("sharpen"), InvalidArgumentException);
    EXPECT_THROW(ParseFilterStage("blur:radius=3"), InvalidArgumentException);
    EXPECT_THROW(ParseFilterStage("blur:sigma=abc"), InvalidArgumentException);
    EXPECT_THROW(ParseFilterStage("blur:sigma"), InvalidArgumentException);
    EXPECT_THROW(ParseFilterStage("crop:width=1.5,height=2"), InvalidArgumentException);
    EXPECT_THROW(ParseFilterStage("brightness:factor=3"), InvalidArgumentException);
    EXPECT_THROW(ParseFilterStage("resize"), InvalidArgumentException);
    EXPECT_THROW(ParseFilterStage("watermark"), InvalidArgumentException);
    EXPECT_THROW(ParseFilterStage("flip:mode=diagonal"), InvalidArgumentException);
}
