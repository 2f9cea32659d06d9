/**
 * @file Compose.cpp
 * @brief Watermark compositing and annotation rendering
 */

#include <PixKit/Compose/Compose.h>
#include <PixKit/Core/Exception.h>
#include <PixKit/Core/Validate.h>
#include <PixKit/Internal/Font.h>
#include <PixKit/Internal/PixelMath.h>

#include <algorithm>
#include <cmath>

namespace Pix::Kit::Compose {

using Internal::ClampU8;

namespace {

constexpr int32_t DETECTION_THICKNESS = 2;
constexpr int32_t LABEL_PADDING = 2;
const Rgba8 LABEL_TEXT_COLOR(0, 0, 0, 255);

bool ToPixelRect(const Rect2d& box, Rect2i& rect) {
    if (!box.IsValid()) {
        return false;
    }
    // Far outside any real image, skip instead of overflowing int32
    constexpr double LIMIT = 1e8;
    if (std::fabs(box.x) > LIMIT || std::fabs(box.y) > LIMIT ||
        box.width > LIMIT || box.height > LIMIT) {
        return false;
    }
    rect = Rect2i(static_cast<int32_t>(std::lround(box.x)),
                  static_cast<int32_t>(std::lround(box.y)),
                  static_cast<int32_t>(std::lround(box.width)),
                  static_cast<int32_t>(std::lround(box.height)));
    return rect.width > 0 && rect.height > 0;
}

} // anonymous namespace

// =============================================================================
// Compositing
// =============================================================================

void Watermark(const PixelBuffer& image, const PixelBuffer& watermark,
               PixelBuffer& output, int32_t x, int32_t y, double opacity) {
    Validate::RequireRange(opacity, 0.0, 1.0, "opacity", "Watermark");
    if (!Validate::RequireImageValid(image, "Watermark")) {
        output = PixelBuffer();
        return;
    }

    PixelBuffer result(image);
    if (watermark.Empty()) {
        output = std::move(result);
        return;
    }

    Rect2i bounds(0, 0, image.Width(), image.Height());
    Rect2i overlap = bounds.Intersect(Rect2i(x, y, watermark.Width(), watermark.Height()));

    for (int32_t py = overlap.y; py < overlap.y + overlap.height; ++py) {
        const Rgba8* wmRow = watermark.RowPtr(py - y);
        Rgba8* dst = result.RowPtr(py);
        for (int32_t px = overlap.x; px < overlap.x + overlap.width; ++px) {
            const Rgba8& wm = wmRow[px - x];
            Rgba8& base = dst[px];

            const double a = wm.a / 255.0 * opacity;
            if (a <= 0.0) {
                continue;
            }
            // Porter-Duff "over" on straight alpha: base colour weighted by base coverage
            const double baseWeight = base.a / 255.0 * (1.0 - a);
            const double outA = a + baseWeight;

            base = Rgba8(ClampU8((wm.r * a + base.r * baseWeight) / outA),
                         ClampU8((wm.g * a + base.g * baseWeight) / outA),
                         ClampU8((wm.b * a + base.b * baseWeight) / outA),
                         ClampU8(255.0 * outA));
        }
    }
    output = std::move(result);
}

// =============================================================================
// Drawing Primitives
// =============================================================================

void FillRectangle(PixelBuffer& image, const Rect2i& rect, const Rgba8& color) {
    if (image.Empty()) {
        return;
    }
    Rect2i clip = rect.Intersect(Rect2i(0, 0, image.Width(), image.Height()));
    for (int32_t y = clip.y; y < clip.y + clip.height; ++y) {
        Rgba8* row = image.RowPtr(y);
        std::fill(row + clip.x, row + clip.x + clip.width, color);
    }
}

void DrawRectangle(PixelBuffer& image, const Rect2i& rect, const Rgba8& color,
                   int32_t thickness) {
    Validate::RequirePositive(thickness, "thickness", "DrawRectangle");
    if (image.Empty() || rect.width <= 0 || rect.height <= 0) {
        return;
    }

    int32_t t = std::min({thickness, rect.width, rect.height});
    // Top, bottom, left, right bands
    FillRectangle(image, Rect2i(rect.x, rect.y, rect.width, t), color);
    FillRectangle(image, Rect2i(rect.x, static_cast<int32_t>(rect.Bottom() - t), rect.width, t),
                  color);
    FillRectangle(image, Rect2i(rect.x, rect.y, t, rect.height), color);
    FillRectangle(image, Rect2i(static_cast<int32_t>(rect.Right() - t), rect.y, t, rect.height),
                  color);
}

void DrawText(PixelBuffer& image, const Point2i& origin, const std::string& text,
              const Rgba8& color, int32_t scale) {
    Validate::RequirePositive(scale, "scale", "DrawText");
    if (image.Empty()) {
        return;
    }

    int32_t penX = origin.x;
    for (char c : text) {
        const uint8_t* rows = Internal::GlyphRows(c);
        for (int32_t gy = 0; gy < Internal::GLYPH_HEIGHT; ++gy) {
            for (int32_t gx = 0; gx < Internal::GLYPH_WIDTH; ++gx) {
                if (!(rows[gy] & (1u << (Internal::GLYPH_WIDTH - 1 - gx)))) {
                    continue;
                }
                FillRectangle(image,
                              Rect2i(penX + gx * scale, origin.y + gy * scale, scale, scale),
                              color);
            }
        }
        penX += Internal::GLYPH_ADVANCE * scale;
    }
}

// =============================================================================
// Annotation
// =============================================================================

Rgba8 DetectionColor(Detection::DetectionKind kind) {
    switch (kind) {
        case Detection::DetectionKind::Object: return Rgba8(0, 255, 0);
        case Detection::DetectionKind::Face: return Rgba8(255, 200, 0);
        case Detection::DetectionKind::Pose: return Rgba8(0, 160, 255);
        case Detection::DetectionKind::Text: return Rgba8(255, 0, 255);
        default: return Rgba8(255, 0, 0);
    }
}

std::string DetectionCaption(const Detection::DetectedObject& detection) {
    double confidence = std::isfinite(detection.confidence) ? detection.confidence : 0.0;
    long percent = std::lround(Internal::Clamp(confidence, 0.0, 1.0) * 100.0);
    return detection.label + " " + std::to_string(percent) + "%";
}

void DrawDetections(const PixelBuffer& image, PixelBuffer& output,
                    const std::vector<Detection::DetectedObject>& detections) {
    if (!Validate::RequireImageValid(image, "DrawDetections")) {
        output = PixelBuffer();
        return;
    }

    PixelBuffer result(image);
    const int32_t tabHeight = Internal::GLYPH_HEIGHT + 2 * LABEL_PADDING;

    for (const auto& det : detections) {
        Rect2i box;
        if (!ToPixelRect(det.boundingBox, box)) {
            continue;
        }
        const Rgba8 color = DetectionColor(det.Kind());
        DrawRectangle(result, box, color, DETECTION_THICKNESS);

        const std::string caption = DetectionCaption(det);
        const int32_t tabWidth = Internal::TextWidth(caption) + 2 * LABEL_PADDING;
        const int32_t tabY = (box.y - tabHeight >= 0) ? box.y - tabHeight : box.y;

        FillRectangle(result, Rect2i(box.x, tabY, tabWidth, tabHeight), color);
        DrawText(result, Point2i(box.x + LABEL_PADDING, tabY + LABEL_PADDING),
                 caption, LABEL_TEXT_COLOR);
    }
    output = std::move(result);
}

} // namespace Pix::Kit::Compose
