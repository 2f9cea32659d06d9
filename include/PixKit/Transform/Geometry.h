#pragma once

/**
 * @file Geometry.h
 * @brief Geometric transforms: resize, rotate, crop, flip
 *
 * API Style: void Func(const PixelBuffer& image, PixelBuffer& output, params...)
 */

#include <PixKit/Core/Export.h>
#include <PixKit/Core/PixelBuffer.h>
#include <PixKit/Core/Types.h>

#include <cstdint>
#include <optional>
#include <string>

namespace Pix::Kit::Transform {

// =============================================================================
// Resize
// =============================================================================

/**
 * @brief Resolve the target size of a resize request
 *
 * A missing dimension is derived from the aspect ratio:
 * round(otherDim * given / origDim), at least 1.
 *
 * @throws InvalidArgumentException if both are missing, a given one is <= 0,
 *         or the derived one does not fit in int32_t
 */
PIXKIT_API Size2i ResolveResizeSize(const Size2i& source,
                                    std::optional<int32_t> width,
                                    std::optional<int32_t> height);

/**
 * @brief Bilinear resample
 *
 * Pixel-center aligned: src = (dst + 0.5) * srcSize / dstSize - 0.5,
 * edges replicated.
 *
 * @param width Target width, std::nullopt to keep the aspect ratio
 * @param height Target height, std::nullopt to keep the aspect ratio
 *
 * @code
 * PixelBuffer thumb;
 * Resize(image, thumb, 160, std::nullopt);  // height follows aspect ratio
 * @endcode
 */
PIXKIT_API void Resize(const PixelBuffer& image, PixelBuffer& output,
                       std::optional<int32_t> width, std::optional<int32_t> height);

// =============================================================================
// Rotate
// =============================================================================

/**
 * @brief Size of the canvas bounding an image rotated by degrees
 *
 * Multiples of 90 degrees give exact sizes (swapped for 90 / 270).
 *
 * @throws InvalidArgumentException if the canvas does not fit in int32_t
 */
PIXKIT_API Size2i RotatedSize(const Size2i& source, double degrees);

/**
 * @brief Rotate about the image center, canvas grown to fit
 *
 * @param degrees Angle in degrees, positive = clockwise on screen
 *
 * Multiples of 90 are lossless remaps. Other angles use inverse mapping with
 * bilinear sampling; uncovered area is transparent black (0, 0, 0, 0).
 */
PIXKIT_API void Rotate(const PixelBuffer& image, PixelBuffer& output, double degrees);

// =============================================================================
// Crop / Flip
// =============================================================================

/**
 * @brief Extract a sub-rectangle
 * @throws InvalidArgumentException if the rectangle is not fully inside
 */
PIXKIT_API void Crop(const PixelBuffer& image, PixelBuffer& output,
                     int32_t x, int32_t y, int32_t width, int32_t height);

/**
 * @brief Mirror axes
 */
enum class FlipMode {
    None,
    Horizontal,     ///< Left <-> right
    Vertical,       ///< Top <-> bottom
    Both
};

/**
 * @brief Parse flip mode ("none", "horizontal", "vertical", "both")
 * @throws InvalidArgumentException if unknown
 */
PIXKIT_API FlipMode ParseFlipMode(const std::string& name);

PIXKIT_API FlipMode MakeFlipMode(bool horizontal, bool vertical);

/**
 * @brief Mirror the image (neither axis = copy)
 */
PIXKIT_API void Flip(const PixelBuffer& image, PixelBuffer& output,
                     bool horizontal, bool vertical);

PIXKIT_API void Flip(const PixelBuffer& image, PixelBuffer& output, FlipMode mode);

} // namespace Pix::Kit::Transform
