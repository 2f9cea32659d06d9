#pragma once

/**
 * @file Constants.h
 * @brief Numeric constants shared by the kernels
 */

#include <cstdint>

namespace Pix::Kit {

constexpr double PI = 3.14159265358979323846;
constexpr double DEG_TO_RAD = PI / 180.0;

/// Tolerance used when snapping angles to multiples of 90 degrees
constexpr double ANGLE_EPSILON = 1e-9;

// BT.601 luminance weights
constexpr double LUMA_R = 0.299;
constexpr double LUMA_G = 0.587;
constexpr double LUMA_B = 0.114;

constexpr int32_t CHANNEL_MAX = 255;

/// Mid-gray pivot for linear contrast scaling
constexpr double CONTRAST_PIVOT = 128.0;

/// Default JPEG quality (stb_image_write scale 1..100)
constexpr int32_t DEFAULT_JPEG_QUALITY = 95;

} // namespace Pix::Kit
