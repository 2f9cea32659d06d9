#pragma once

/**
 * @file Interpolate.h
 * @brief Sub-pixel sampling of RGBA buffers
 */

#include <PixKit/Core/PixelBuffer.h>
#include <PixKit/Core/Types.h>
#include <PixKit/Internal/Convolution.h>

namespace Pix::Kit::Internal {

/**
 * @brief Bilinear sample at a sub-pixel position
 * @param image Source buffer (non-empty)
 * @param x Column in pixel coordinates (pixel centers at integers)
 * @param y Row in pixel coordinates
 * @param border Handling of taps outside the image
 * @param borderColor Value of outside taps for BorderMode::Constant
 *
 * All four channels are interpolated independently.
 */
Rgba8 SampleBilinear(const PixelBuffer& image, double x, double y,
                     BorderMode border = BorderMode::Replicate,
                     const Rgba8& borderColor = Rgba8(0, 0, 0, 0));

} // namespace Pix::Kit::Internal
