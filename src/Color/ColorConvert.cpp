/**
 * @file ColorConvert.cpp
 * @brief Luminance and HSL conversion
 */

#include <PixKit/Color/ColorConvert.h>
#include <PixKit/Core/Constants.h>
#include <PixKit/Internal/PixelMath.h>

#include <algorithm>
#include <cmath>

namespace Pix::Kit::Color {

using Internal::ClampU8;

double Luminance(uint8_t r, uint8_t g, uint8_t b) {
    return LUMA_R * r + LUMA_G * g + LUMA_B * b;
}

Hsl RgbToHsl(uint8_t r, uint8_t g, uint8_t b) {
    double rd = r / 255.0;
    double gd = g / 255.0;
    double bd = b / 255.0;

    double maxVal = std::max({rd, gd, bd});
    double minVal = std::min({rd, gd, bd});
    double diff = maxVal - minVal;

    Hsl hsl;
    hsl.l = (maxVal + minVal) / 2.0;

    // Achromatic
    if (diff == 0) {
        return hsl;
    }

    hsl.s = diff / (1.0 - std::fabs(2.0 * hsl.l - 1.0));

    if (maxVal == rd) {
        hsl.h = 60.0 * std::fmod((gd - bd) / diff + 6.0, 6.0);
    } else if (maxVal == gd) {
        hsl.h = 60.0 * ((bd - rd) / diff + 2.0);
    } else {
        hsl.h = 60.0 * ((rd - gd) / diff + 4.0);
    }
    return hsl;
}

void HslToRgb(const Hsl& hsl, uint8_t& r, uint8_t& g, uint8_t& b) {
    if (hsl.s <= 0.0) {
        r = g = b = ClampU8(hsl.l * 255.0);
        return;
    }

    double hd = std::fmod(hsl.h, 360.0);
    if (hd < 0.0) hd += 360.0;

    double c = (1.0 - std::fabs(2.0 * hsl.l - 1.0)) * hsl.s;
    double x = c * (1.0 - std::fabs(std::fmod(hd / 60.0, 2.0) - 1.0));
    double m = hsl.l - c / 2.0;

    double rd, gd, bd;
    if (hd < 60) { rd = c; gd = x; bd = 0; }
    else if (hd < 120) { rd = x; gd = c; bd = 0; }
    else if (hd < 180) { rd = 0; gd = c; bd = x; }
    else if (hd < 240) { rd = 0; gd = x; bd = c; }
    else if (hd < 300) { rd = x; gd = 0; bd = c; }
    else { rd = c; gd = 0; bd = x; }

    r = ClampU8((rd + m) * 255.0);
    g = ClampU8((gd + m) * 255.0);
    b = ClampU8((bd + m) * 255.0);
}

} // namespace Pix::Kit::Color
