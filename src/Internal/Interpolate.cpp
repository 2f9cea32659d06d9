/**
 * @file Interpolate.cpp
 * @brief Bilinear sampling implementation
 */

#include <PixKit/Internal/Interpolate.h>
#include <PixKit/Internal/PixelMath.h>

#include <cmath>

namespace Pix::Kit::Internal {

namespace {

inline const Rgba8& Tap(const PixelBuffer& image, int32_t x, int32_t y,
                        BorderMode border, const Rgba8& borderColor) {
    int32_t sx = BorderIndex(x, image.Width(), border);
    int32_t sy = BorderIndex(y, image.Height(), border);
    if (sx < 0 || sy < 0) {
        return borderColor;
    }
    return image.At(sx, sy);
}

} // anonymous namespace

Rgba8 SampleBilinear(const PixelBuffer& image, double x, double y,
                     BorderMode border, const Rgba8& borderColor) {
    int32_t x0 = static_cast<int32_t>(std::floor(x));
    int32_t y0 = static_cast<int32_t>(std::floor(y));
    double fx = x - x0;
    double fy = y - y0;

    const Rgba8& p00 = Tap(image, x0, y0, border, borderColor);
    const Rgba8& p10 = Tap(image, x0 + 1, y0, border, borderColor);
    const Rgba8& p01 = Tap(image, x0, y0 + 1, border, borderColor);
    const Rgba8& p11 = Tap(image, x0 + 1, y0 + 1, border, borderColor);

    double w00 = (1.0 - fx) * (1.0 - fy);
    double w10 = fx * (1.0 - fy);
    double w01 = (1.0 - fx) * fy;
    double w11 = fx * fy;

    auto mix = [&](uint8_t a, uint8_t b, uint8_t c, uint8_t d) {
        return ClampU8(a * w00 + b * w10 + c * w01 + d * w11);
    };

    return Rgba8(mix(p00.r, p10.r, p01.r, p11.r),
                 mix(p00.g, p10.g, p01.g, p11.g),
                 mix(p00.b, p10.b, p01.b, p11.b),
                 mix(p00.a, p10.a, p01.a, p11.a));
}

} // namespace Pix::Kit::Internal
