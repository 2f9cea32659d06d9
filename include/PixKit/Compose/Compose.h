#pragma once

/**
 * @file Compose.h
 * @brief Compositing and annotation drawing
 *
 * Drawing primitives modify a buffer in place and clip to its bounds.
 * Watermark and DrawDetections follow the kernel style
 * (const input, separate output).
 */

#include <PixKit/Core/Export.h>
#include <PixKit/Core/PixelBuffer.h>
#include <PixKit/Core/Types.h>
#include <PixKit/Detection/DetectedObject.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Pix::Kit::Compose {

// =============================================================================
// Compositing
// =============================================================================

/**
 * @brief Alpha-composite a watermark onto an image (Porter-Duff "over")
 *
 * a = wa / 255 * opacity, ba = base alpha / 255
 * outA = a + ba * (1 - a)
 * rgb = (wm * a + base * ba * (1 - a)) / outA
 * alpha = 255 * outA
 *
 * Pixels where a == 0 are left untouched.
 *
 * @param x Left offset of the watermark (may be negative)
 * @param y Top offset of the watermark (may be negative)
 * @param opacity Watermark alpha multiplier in [0, 1]
 *
 * Parts of the watermark outside the image are clipped.
 */
PIXKIT_API void Watermark(const PixelBuffer& image, const PixelBuffer& watermark,
                          PixelBuffer& output, int32_t x = 0, int32_t y = 0,
                          double opacity = 1.0);

// =============================================================================
// Drawing Primitives
// =============================================================================

/**
 * @brief Draw a rectangle outline, thickness grows inwards
 */
PIXKIT_API void DrawRectangle(PixelBuffer& image, const Rect2i& rect,
                              const Rgba8& color, int32_t thickness = 1);

/**
 * @brief Fill a rectangle
 */
PIXKIT_API void FillRectangle(PixelBuffer& image, const Rect2i& rect, const Rgba8& color);

/**
 * @brief Render text with the built-in 5x7 font
 * @param origin Top-left corner of the first glyph
 * @param scale Integer magnification (>= 1)
 */
PIXKIT_API void DrawText(PixelBuffer& image, const Point2i& origin, const std::string& text,
                         const Rgba8& color, int32_t scale = 1);

// =============================================================================
// Annotation
// =============================================================================

/// Outline color used for a detection kind
PIXKIT_API Rgba8 DetectionColor(Detection::DetectionKind kind);

/// Tab caption: "<label> <NN>%"
PIXKIT_API std::string DetectionCaption(const Detection::DetectedObject& detection);

/**
 * @brief Draw box outlines (thickness 2) and captioned label tabs
 *
 * The tab sits above the box when there is room, otherwise inside its top
 * edge. Boxes with non-finite coordinates are skipped.
 */
PIXKIT_API void DrawDetections(const PixelBuffer& image, PixelBuffer& output,
                               const std::vector<Detection::DetectedObject>& detections);

} // namespace Pix::Kit::Compose
