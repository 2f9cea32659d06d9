#pragma once

/**
 * @file Filter.h
 * @brief Tone, color and neighbourhood filters
 *
 * API Style: void Func(const PixelBuffer& image, PixelBuffer& output, params...)
 *
 * - Output has the same dimensions as the input
 * - Empty input yields empty output
 * - Invalid parameters throw InvalidArgumentException (never clamped)
 * - image and output may be the same object
 */

#include <PixKit/Core/Export.h>
#include <PixKit/Core/PixelBuffer.h>

#include <cstdint>

namespace Pix::Kit::Filter {

// =============================================================================
// Tone Mapping
// =============================================================================

/**
 * @brief Convert to gray using BT.601 luminance
 *
 * Each pixel becomes round(0.299 R + 0.587 G + 0.114 B) on all three color
 * channels. Alpha is preserved.
 */
PIXKIT_API void Grayscale(const PixelBuffer& image, PixelBuffer& output);

/**
 * @brief Add a brightness offset
 *
 * @param factor Offset in [-1, 1], mapped to factor * 100 per color channel
 *
 * @code
 * PixelBuffer brighter;
 * AdjustBrightness(image, brighter, 0.2);  // +20 on R, G and B
 * @endcode
 */
PIXKIT_API void AdjustBrightness(const PixelBuffer& image, PixelBuffer& output, double factor);

/**
 * @brief Apply the classic sepia tone matrix
 *
 * R' = .393R + .769G + .189B
 * G' = .349R + .686G + .168B
 * B' = .272R + .534G + .131B
 */
PIXKIT_API void Sepia(const PixelBuffer& image, PixelBuffer& output);

/**
 * @brief Invert color channels (255 - c), alpha preserved
 */
PIXKIT_API void Invert(const PixelBuffer& image, PixelBuffer& output);

/**
 * @brief Linear contrast around mid-gray
 *
 * c' = (c - 128) * factor + 128
 *
 * @param factor Contrast multiplier (>= 0, 1.0 = neutral)
 */
PIXKIT_API void AdjustContrast(const PixelBuffer& image, PixelBuffer& output, double factor);

/**
 * @brief Scale HSL saturation
 *
 * @param factor Saturation multiplier (>= 0, 1.0 = neutral, 0 = gray)
 */
PIXKIT_API void AdjustSaturation(const PixelBuffer& image, PixelBuffer& output, double factor);

// =============================================================================
// Smoothing
// =============================================================================

/**
 * @brief Gaussian blur
 *
 * Kernel radius is round(sigma), weights use sigma_k = radius * 2/3.
 * Edge pixels are replicated. All four channels are filtered.
 *
 * @param sigma Blur strength (>= 0, 0 = copy)
 */
PIXKIT_API void GaussBlur(const PixelBuffer& image, PixelBuffer& output, double sigma);

/**
 * @brief Gaussian blur with an explicit integer radius
 *
 * @param radius Kernel half width (>= 0, 0 = copy)
 */
PIXKIT_API void GaussBlurRadius(const PixelBuffer& image, PixelBuffer& output, int32_t radius);

// =============================================================================
// Artistic Effects
// =============================================================================

/**
 * @brief Radial darkening towards the corners
 *
 * For each pixel at normalized distance d from (w/2, h/2) (distance over the
 * half diagonal): factor = 1 - d² * intensity * radius. Color channels are
 * multiplied by factor, then rounded and clamped. The factor itself is not
 * clamped, so values outside [0, 1] are accepted.
 *
 * @param intensity Darkening strength (finite, nominally [0, 1])
 * @param radius Falloff scale (finite, nominally [0, 1])
 */
PIXKIT_API void Vignette(const PixelBuffer& image, PixelBuffer& output,
                         double intensity = 0.5, double radius = 0.5);

/**
 * @brief Watercolor look: blur, then saturation x1.2, then contrast x1.1
 *
 * @param radius Blur radius (>= 0)
 */
PIXKIT_API void Watercolor(const PixelBuffer& image, PixelBuffer& output, int32_t radius = 5);

/**
 * @brief Posterized "oil painting" effect
 *
 * For each pixel, the square neighbourhood of side 2 * radius + 1 is scanned
 * row-major (outside pixels skipped). Neighbours are bucketed by
 * round(round((R+G+B)/3) * levels / 255); the most frequent bucket wins, the
 * first bucket to reach the highest count keeps it on ties. Output is the
 * rounded mean RGB of that bucket with alpha 255.
 *
 * @param radius Neighbourhood half size (>= 0)
 * @param levels Number of intensity levels (>= 1)
 */
PIXKIT_API void OilPainting(const PixelBuffer& image, PixelBuffer& output,
                            int32_t radius = 4, int32_t levels = 20);

} // namespace Pix::Kit::Filter
