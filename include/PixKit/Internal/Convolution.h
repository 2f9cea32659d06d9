#pragma once

/**
 * @file Convolution.h
 * @brief Separable convolution on single-channel planes
 *
 * Kernels are odd-sized, centered. Planes are dense row-major
 * (stride == width).
 */

#include <cstdint>

namespace Pix::Kit::Internal {

/**
 * @brief Out-of-bounds sampling policy
 */
enum class BorderMode {
    Replicate,      ///< aaa|abcd|ddd (clamp to edge)
    Constant        ///< Use a fixed value outside the image
};

/**
 * @brief Map an out-of-range coordinate into [0, size)
 * @return Valid index, or -1 for BorderMode::Constant outside the range
 */
int32_t BorderIndex(int32_t i, int32_t size, BorderMode mode);

/**
 * @brief Separable 2D convolution of an 8-bit plane (row pass, then column pass)
 * @param src Source plane, width * height values
 * @param dst Unrounded result, width * height values
 * @param borderValue Value of outside taps for BorderMode::Constant
 *
 * The intermediate row result is kept in double precision.
 */
void ConvolveSeparable(const uint8_t* src, double* dst, int32_t width, int32_t height,
                       const double* kernelX, int32_t kernelXSize,
                       const double* kernelY, int32_t kernelYSize,
                       BorderMode border = BorderMode::Replicate, double borderValue = 0.0);

} // namespace Pix::Kit::Internal
