#pragma once

/**
 * @file ColorConvert.h
 * @brief Per-pixel color space helpers
 *
 * Provides:
 * - BT.601 luminance
 * - RGB <-> HSL in double precision (H in degrees, S and L in [0, 1])
 */

#include <PixKit/Core/Export.h>
#include <PixKit/Core/Types.h>

#include <cstdint>
#include <string>

namespace Pix::Kit::Color {

/**
 * @brief HSL triple
 */
struct PIXKIT_API Hsl {
    double h = 0.0;     ///< Hue in degrees [0, 360)
    double s = 0.0;     ///< Saturation [0, 1]
    double l = 0.0;     ///< Lightness [0, 1]
};

/**
 * @brief BT.601 luma of an RGB triple, unrounded
 * @return 0.299 R + 0.587 G + 0.114 B in [0, 255]
 */
PIXKIT_API double Luminance(uint8_t r, uint8_t g, uint8_t b);

/// Luma of a pixel, alpha ignored
inline double Luminance(const Rgba8& px) {
    return Luminance(px.r, px.g, px.b);
}

/**
 * @brief Convert 8-bit RGB to HSL
 */
PIXKIT_API Hsl RgbToHsl(uint8_t r, uint8_t g, uint8_t b);

/**
 * @brief Convert HSL back to 8-bit RGB (rounded, saturated)
 */
PIXKIT_API void HslToRgb(const Hsl& hsl, uint8_t& r, uint8_t& g, uint8_t& b);

} // namespace Pix::Kit::Color
