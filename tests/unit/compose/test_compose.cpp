/**
 * @file test_compose.cpp
 * @brief Unit tests for Compose/Compose.h
 */

#include <PixKit/Compose/Compose.h>
#include <PixKit/Core/Exception.h>
#include <PixKit/Internal/Font.h>
#include <gtest/gtest.h>

#include <limits>

using namespace Pix::Kit;
using namespace Pix::Kit::Compose;
using namespace Pix::Kit::Detection;

class ComposeTest : public ::testing::Test {
protected:
    const Rgba8 white_{255, 255, 255, 255};
    const Rgba8 black_{0, 0, 0, 255};
};

// ============================================================================
// Watermark
// ============================================================================

TEST_F(ComposeTest, OpaqueWatermarkReplacesPixels) {
    PixelBuffer base(10, 10, black_);
    PixelBuffer mark(3, 3, Rgba8(200, 100, 50, 255));
    PixelBuffer out;
    Watermark(base, mark, out, 2, 4);
    EXPECT_EQ(out.At(2, 4), Rgba8(200, 100, 50, 255));
    EXPECT_EQ(out.At(4, 6), Rgba8(200, 100, 50, 255));
    EXPECT_EQ(out.At(5, 6), black_);
    EXPECT_EQ(out.At(1, 4), black_);
}

TEST_F(ComposeTest, HalfOpacityBlends) {
    PixelBuffer base(2, 2, black_);
    PixelBuffer mark(2, 2, Rgba8(200, 100, 50, 255));
    PixelBuffer out;
    Watermark(base, mark, out, 0, 0, 0.5);
    EXPECT_EQ(out.At(1, 1), Rgba8(100, 50, 25, 255));
}

TEST_F(ComposeTest, WatermarkAlphaIsRespected) {
    PixelBuffer base(1, 1, black_);
    PixelBuffer mark(1, 1, Rgba8(255, 255, 255, 0));
    PixelBuffer out;
    Watermark(base, mark, out);
    EXPECT_EQ(out, base);
}

TEST_F(ComposeTest, WatermarkOverTransparentBase) {
    PixelBuffer base(1, 1, Rgba8(0, 0, 0, 0));
    PixelBuffer mark(1, 1, Rgba8(10, 20, 30, 255));
    PixelBuffer out;
    Watermark(base, mark, out);
    EXPECT_EQ(out.At(0, 0), Rgba8(10, 20, 30, 255));
}

TEST_F(ComposeTest, TranslucentWatermarkOverTransparentBaseKeepsColor) {
    // Hidden colour of a fully transparent base must not darken the result
    PixelBuffer base(1, 1, Rgba8(0, 0, 0, 0));
    PixelBuffer mark(1, 1, white_);
    PixelBuffer out;
    Watermark(base, mark, out, 0, 0, 0.5);
    EXPECT_EQ(out.At(0, 0), Rgba8(255, 255, 255, 128));
}

TEST_F(ComposeTest, WatermarkOverHalfTransparentBase) {
    // a = 0.5, base weight = 0.5 * 0.5 = 0.25, out alpha = 0.75
    PixelBuffer base(1, 1, Rgba8(0, 0, 240, 255 / 2));
    PixelBuffer mark(1, 1, Rgba8(240, 0, 0, 255));
    PixelBuffer out;
    Watermark(base, mark, out, 0, 0, 0.5);
    const Rgba8 px = out.At(0, 0);
    EXPECT_EQ(px.r, 160);   // 240 * 0.5 / 0.75
    EXPECT_NEAR(px.b, 80, 1);
    EXPECT_NEAR(px.a, 191, 1);
}

TEST_F(ComposeTest, WatermarkOffsetNearIntLimitsIsClipped) {
    PixelBuffer base(4, 4, black_);
    PixelBuffer mark(8, 8, white_);
    PixelBuffer out;
    const int32_t maxInt = std::numeric_limits<int32_t>::max();
    const int32_t minInt = std::numeric_limits<int32_t>::min();

    Watermark(base, mark, out, maxInt - 2, 0);
    EXPECT_EQ(out, base);
    Watermark(base, mark, out, 0, maxInt);
    EXPECT_EQ(out, base);
    Watermark(base, mark, out, minInt, minInt);
    EXPECT_EQ(out, base);
}

TEST_F(ComposeTest, WatermarkClipsAtEdges) {
    PixelBuffer base(4, 4, black_);
    PixelBuffer mark(4, 4, white_);
    PixelBuffer out;
    Watermark(base, mark, out, -2, 3);
    EXPECT_EQ(out.At(0, 3), white_);
    EXPECT_EQ(out.At(1, 3), white_);
    EXPECT_EQ(out.At(2, 3), black_);
    EXPECT_EQ(out.At(0, 2), black_);

    // Entirely outside
    Watermark(base, mark, out, 100, 100);
    EXPECT_EQ(out, base);
}

TEST_F(ComposeTest, WatermarkZeroOpacityOrEmptyIsCopy) {
    PixelBuffer base(3, 3, Rgba8(5, 6, 7, 255));
    PixelBuffer out;
    Watermark(base, PixelBuffer(3, 3, white_), out, 0, 0, 0.0);
    EXPECT_EQ(out, base);
    Watermark(base, PixelBuffer(), out);
    EXPECT_EQ(out, base);
}

TEST_F(ComposeTest, WatermarkOpacityValidated) {
    PixelBuffer out;
    EXPECT_THROW(Watermark(PixelBuffer(2, 2), PixelBuffer(1, 1), out, 0, 0, 1.5),
                 InvalidArgumentException);
    EXPECT_THROW(Watermark(PixelBuffer(2, 2), PixelBuffer(), out, 0, 0, -0.1),
                 InvalidArgumentException);
}

// ============================================================================
// Drawing Primitives
// ============================================================================

TEST_F(ComposeTest, DrawRectangleOutline) {
    PixelBuffer img(10, 10, black_);
    DrawRectangle(img, Rect2i(2, 2, 6, 6), white_, 2);
    EXPECT_EQ(img.At(2, 2), white_);
    EXPECT_EQ(img.At(3, 5), white_);
    EXPECT_EQ(img.At(7, 7), white_);
    EXPECT_EQ(img.At(4, 4), black_);
    EXPECT_EQ(img.At(1, 1), black_);
}

TEST_F(ComposeTest, DrawRectangleClipsOffImage) {
    PixelBuffer img(5, 5, black_);
    EXPECT_NO_THROW(DrawRectangle(img, Rect2i(-3, -3, 20, 20), white_, 1));
    EXPECT_EQ(img.At(2, 2), black_);
    EXPECT_THROW(DrawRectangle(img, Rect2i(0, 0, 2, 2), white_, 0), InvalidArgumentException);
}

TEST_F(ComposeTest, FillRectangleClips) {
    PixelBuffer img(4, 4, black_);
    FillRectangle(img, Rect2i(2, 2, 10, 10), white_);
    EXPECT_EQ(img.At(3, 3), white_);
    EXPECT_EQ(img.At(1, 3), black_);
}

TEST_F(ComposeTest, DrawTextSetsGlyphPixels) {
    PixelBuffer img(20, 10, black_);
    DrawText(img, Point2i(0, 0), "I", white_);
    // 'I' top row is .###.
    EXPECT_EQ(img.At(0, 0), black_);
    EXPECT_EQ(img.At(1, 0), white_);
    EXPECT_EQ(img.At(3, 0), white_);
    EXPECT_EQ(img.At(2, 3), white_);
    EXPECT_EQ(img.At(1, 3), black_);
}

TEST_F(ComposeTest, DrawTextScales) {
    PixelBuffer img(20, 20, black_);
    DrawText(img, Point2i(0, 0), "I", white_, 2);
    EXPECT_EQ(img.At(2, 0), white_);
    EXPECT_EQ(img.At(3, 1), white_);
    EXPECT_EQ(img.At(1, 1), black_);
}

// ============================================================================
// Detections
// ============================================================================

TEST_F(ComposeTest, ColorsPerKind) {
    EXPECT_EQ(DetectionColor(DetectionKind::Object), Rgba8(0, 255, 0));
    EXPECT_EQ(DetectionColor(DetectionKind::Face), Rgba8(255, 200, 0));
    EXPECT_EQ(DetectionColor(DetectionKind::Unknown), Rgba8(255, 0, 0));
}

TEST_F(ComposeTest, CaptionFormatsPercent) {
    DetectedObject face = MakeFaceDetection(Rect2d(0, 0, 10, 10), FaceDetails{});
    EXPECT_EQ(DetectionCaption(face), "Face 80%");

    DetectedObject odd;
    odd.label = "x";
    odd.confidence = 3.0;
    EXPECT_EQ(DetectionCaption(odd), "x 100%");
    odd.confidence = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(DetectionCaption(odd), "x 0%");
}

TEST_F(ComposeTest, DrawDetectionsOutlinesAndTabs) {
    PixelBuffer img(100, 100, white_);
    ObjectDetails details;
    details.labels.push_back({"Cat", 0.75});
    std::vector<DetectedObject> dets = {MakeObjectDetection(Rect2d(20, 30, 40, 40), details)};

    PixelBuffer out;
    DrawDetections(img, out, dets);

    const Rgba8 green(0, 255, 0);
    // Outline
    EXPECT_EQ(out.At(20, 50), green);
    EXPECT_EQ(out.At(59, 69), green);
    EXPECT_EQ(out.At(40, 50), white_);
    // Tab above the box, padding row keeps the tab color
    EXPECT_EQ(out.At(21, 19), green);
    EXPECT_EQ(out.At(21, 18), white_);
    // Input untouched
    EXPECT_EQ(img.At(20, 50), white_);
}

TEST_F(ComposeTest, TabMovesInsideAtTopEdge) {
    PixelBuffer img(60, 60, white_);
    std::vector<DetectedObject> dets = {
        MakeTextDetection(Rect2d(5, 0, 50, 50), TextDetails{"hi", {"hi"}})};
    PixelBuffer out;
    DrawDetections(img, out, dets);
    const Rgba8 magenta(255, 0, 255);
    // Bottom padding of a tab drawn from y = 0
    EXPECT_EQ(out.At(10, 10), magenta);
    EXPECT_EQ(out.At(10, 12), white_);
}

TEST_F(ComposeTest, InvalidBoxesSkipped) {
    PixelBuffer img(10, 10, white_);
    DetectedObject bad;
    bad.label = "bad";
    bad.boundingBox = Rect2d(std::numeric_limits<double>::infinity(), 0, 5, 5);
    DetectedObject huge;
    huge.boundingBox = Rect2d(0, 0, 1e12, 5);
    PixelBuffer out;
    DrawDetections(img, out, {bad, huge});
    EXPECT_EQ(out, img);

    DrawDetections(img, out, {});
    EXPECT_EQ(out, img);
}
