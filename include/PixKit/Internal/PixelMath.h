#pragma once

/**
 * @file PixelMath.h
 * @brief Saturating channel arithmetic shared by the kernels
 */

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace Pix::Kit::Internal {

inline double Clamp(double val, double minVal, double maxVal) {
    return std::max(minVal, std::min(maxVal, val));
}

/**
 * @brief Round to nearest and saturate to [0, 255]
 *
 * NaN maps to 0.
 */
inline uint8_t ClampU8(double val) {
    if (!(val == val)) {
        return 0;
    }
    return static_cast<uint8_t>(std::lround(Clamp(val, 0.0, 255.0)));
}

} // namespace Pix::Kit::Internal
