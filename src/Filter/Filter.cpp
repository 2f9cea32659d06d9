/**
 * @file Filter.cpp
 * @brief Tone, color and neighbourhood filter implementations
 */

#include <PixKit/Filter/Filter.h>
#include <PixKit/Color/ColorConvert.h>
#include <PixKit/Core/Constants.h>
#include <PixKit/Core/Exception.h>
#include <PixKit/Core/Validate.h>
#include <PixKit/Internal/Convolution.h>
#include <PixKit/Internal/Gaussian.h>
#include <PixKit/Internal/PixelMath.h>

#include <algorithm>
#include <cmath>
#include <vector>

namespace Pix::Kit::Filter {

using Internal::ClampU8;

namespace {

// Saturation and contrast multipliers of the watercolor look
constexpr double WATERCOLOR_SATURATION = 1.2;
constexpr double WATERCOLOR_CONTRAST = 1.1;

constexpr double BRIGHTNESS_SCALE = 100.0;

/**
 * @brief Apply a per-pixel functor into a fresh buffer, then move it to output
 *
 * Writing into a temporary keeps image == output safe.
 */
template<typename PixelFunc>
void MapPixels(const PixelBuffer& image, PixelBuffer& output, PixelFunc func) {
    PixelBuffer result(image.Width(), image.Height());
    const size_t count = image.PixelCount();
    const Rgba8* src = image.Data();
    Rgba8* dst = result.Data();
    for (size_t i = 0; i < count; ++i) {
        dst[i] = func(src[i]);
    }
    output = std::move(result);
}

// Extract one channel plane (0 = R .. 3 = A)
void ExtractChannel(const PixelBuffer& image, int channel, std::vector<uint8_t>& plane) {
    const size_t count = image.PixelCount();
    plane.resize(count);
    const Rgba8* src = image.Data();
    for (size_t i = 0; i < count; ++i) {
        switch (channel) {
            case 0: plane[i] = src[i].r; break;
            case 1: plane[i] = src[i].g; break;
            case 2: plane[i] = src[i].b; break;
            default: plane[i] = src[i].a; break;
        }
    }
}

void StoreChannel(const std::vector<double>& plane, int channel, PixelBuffer& image) {
    const size_t count = image.PixelCount();
    Rgba8* dst = image.Data();
    for (size_t i = 0; i < count; ++i) {
        uint8_t v = ClampU8(plane[i]);
        switch (channel) {
            case 0: dst[i].r = v; break;
            case 1: dst[i].g = v; break;
            case 2: dst[i].b = v; break;
            default: dst[i].a = v; break;
        }
    }
}

void BlurWithRadius(const PixelBuffer& image, PixelBuffer& output, int32_t radius) {
    if (radius == 0) {
        output = image;
        return;
    }

    std::vector<double> kernel = Internal::Gaussian::KernelForRadius(radius);
    const int32_t kernelSize = static_cast<int32_t>(kernel.size());
    const int32_t w = image.Width();
    const int32_t h = image.Height();

    PixelBuffer result(w, h);
    std::vector<uint8_t> src;
    std::vector<double> dst(image.PixelCount());

    for (int c = 0; c < 4; ++c) {
        ExtractChannel(image, c, src);
        Internal::ConvolveSeparable(
            src.data(), dst.data(), w, h,
            kernel.data(), kernelSize, kernel.data(), kernelSize,
            Internal::BorderMode::Replicate);
        StoreChannel(dst, c, result);
    }

    output = std::move(result);
}

} // anonymous namespace

// =============================================================================
// Tone Mapping
// =============================================================================

void Grayscale(const PixelBuffer& image, PixelBuffer& output) {
    if (!Validate::RequireImageValid(image, "Grayscale")) {
        output = PixelBuffer();
        return;
    }

    MapPixels(image, output, [](const Rgba8& px) {
        uint8_t y = ClampU8(Color::Luminance(px));
        return Rgba8(y, y, y, px.a);
    });
}

void AdjustBrightness(const PixelBuffer& image, PixelBuffer& output, double factor) {
    Validate::RequireRange(factor, -1.0, 1.0, "factor", "AdjustBrightness");
    if (!Validate::RequireImageValid(image, "AdjustBrightness")) {
        output = PixelBuffer();
        return;
    }

    const double offset = factor * BRIGHTNESS_SCALE;
    MapPixels(image, output, [offset](const Rgba8& px) {
        return Rgba8(ClampU8(px.r + offset), ClampU8(px.g + offset),
                     ClampU8(px.b + offset), px.a);
    });
}

void Sepia(const PixelBuffer& image, PixelBuffer& output) {
    if (!Validate::RequireImageValid(image, "Sepia")) {
        output = PixelBuffer();
        return;
    }

    MapPixels(image, output, [](const Rgba8& px) {
        double r = px.r, g = px.g, b = px.b;
        return Rgba8(ClampU8(0.393 * r + 0.769 * g + 0.189 * b),
                     ClampU8(0.349 * r + 0.686 * g + 0.168 * b),
                     ClampU8(0.272 * r + 0.534 * g + 0.131 * b),
                     px.a);
    });
}

void Invert(const PixelBuffer& image, PixelBuffer& output) {
    if (!Validate::RequireImageValid(image, "Invert")) {
        output = PixelBuffer();
        return;
    }

    MapPixels(image, output, [](const Rgba8& px) {
        return Rgba8(static_cast<uint8_t>(CHANNEL_MAX - px.r),
                     static_cast<uint8_t>(CHANNEL_MAX - px.g),
                     static_cast<uint8_t>(CHANNEL_MAX - px.b),
                     px.a);
    });
}

void AdjustContrast(const PixelBuffer& image, PixelBuffer& output, double factor) {
    Validate::RequireFinite(factor, "factor", "AdjustContrast");
    Validate::RequireNonNegative(factor, "factor", "AdjustContrast");
    if (!Validate::RequireImageValid(image, "AdjustContrast")) {
        output = PixelBuffer();
        return;
    }

    // 256-entry lookup, identical for every channel
    uint8_t lut[256];
    for (int i = 0; i < 256; ++i) {
        lut[i] = ClampU8((i - CONTRAST_PIVOT) * factor + CONTRAST_PIVOT);
    }

    MapPixels(image, output, [&lut](const Rgba8& px) {
        return Rgba8(lut[px.r], lut[px.g], lut[px.b], px.a);
    });
}

void AdjustSaturation(const PixelBuffer& image, PixelBuffer& output, double factor) {
    Validate::RequireFinite(factor, "factor", "AdjustSaturation");
    Validate::RequireNonNegative(factor, "factor", "AdjustSaturation");
    if (!Validate::RequireImageValid(image, "AdjustSaturation")) {
        output = PixelBuffer();
        return;
    }

    MapPixels(image, output, [factor](const Rgba8& px) {
        Color::Hsl hsl = Color::RgbToHsl(px.r, px.g, px.b);
        hsl.s = Internal::Clamp(hsl.s * factor, 0.0, 1.0);
        Rgba8 out;
        Color::HslToRgb(hsl, out.r, out.g, out.b);
        out.a = px.a;
        return out;
    });
}

// =============================================================================
// Smoothing
// =============================================================================

void GaussBlur(const PixelBuffer& image, PixelBuffer& output, double sigma) {
    Validate::RequireFinite(sigma, "sigma", "GaussBlur");
    Validate::RequireNonNegative(sigma, "sigma", "GaussBlur");
    if (!Validate::RequireImageValid(image, "GaussBlur")) {
        output = PixelBuffer();
        return;
    }

    BlurWithRadius(image, output, Internal::Gaussian::RadiusFromSigma(sigma));
}

void GaussBlurRadius(const PixelBuffer& image, PixelBuffer& output, int32_t radius) {
    Validate::RequireNonNegative(radius, "radius", "GaussBlurRadius");
    if (!Validate::RequireImageValid(image, "GaussBlurRadius")) {
        output = PixelBuffer();
        return;
    }

    BlurWithRadius(image, output, radius);
}

// =============================================================================
// Artistic Effects
// =============================================================================

void Vignette(const PixelBuffer& image, PixelBuffer& output, double intensity, double radius) {
    Validate::RequireFinite(intensity, "intensity", "Vignette");
    Validate::RequireFinite(radius, "radius", "Vignette");
    if (!Validate::RequireImageValid(image, "Vignette")) {
        output = PixelBuffer();
        return;
    }

    const int32_t w = image.Width();
    const int32_t h = image.Height();
    const double cx = w / 2.0;
    const double cy = h / 2.0;
    const double maxDist = std::sqrt(cx * cx + cy * cy);
    const double strength = intensity * radius;

    PixelBuffer result(w, h);
    for (int32_t y = 0; y < h; ++y) {
        const Rgba8* src = image.RowPtr(y);
        Rgba8* dst = result.RowPtr(y);
        const double dy = y - cy;
        for (int32_t x = 0; x < w; ++x) {
            const double dx = x - cx;
            const double d = std::sqrt(dx * dx + dy * dy) / maxDist;
            const double factor = 1.0 - d * d * strength;
            dst[x] = Rgba8(ClampU8(src[x].r * factor), ClampU8(src[x].g * factor),
                           ClampU8(src[x].b * factor), src[x].a);
        }
    }
    output = std::move(result);
}

void Watercolor(const PixelBuffer& image, PixelBuffer& output, int32_t radius) {
    Validate::RequireNonNegative(radius, "radius", "Watercolor");
    if (!Validate::RequireImageValid(image, "Watercolor")) {
        output = PixelBuffer();
        return;
    }

    PixelBuffer blurred;
    BlurWithRadius(image, blurred, radius);

    PixelBuffer saturated;
    AdjustSaturation(blurred, saturated, WATERCOLOR_SATURATION);
    AdjustContrast(saturated, output, WATERCOLOR_CONTRAST);
}

void OilPainting(const PixelBuffer& image, PixelBuffer& output, int32_t radius, int32_t levels) {
    Validate::RequireNonNegative(radius, "radius", "OilPainting");
    Validate::RequireMin(levels, 1, "levels", "OilPainting");
    if (!Validate::RequireImageValid(image, "OilPainting")) {
        output = PixelBuffer();
        return;
    }

    const int32_t w = image.Width();
    const int32_t h = image.Height();

    // Bin of every source pixel, computed once
    std::vector<int32_t> bins(image.PixelCount());
    {
        const Rgba8* src = image.Data();
        for (size_t i = 0; i < bins.size(); ++i) {
            int32_t intensity = static_cast<int32_t>(
                std::lround((src[i].r + src[i].g + src[i].b) / 3.0));
            bins[i] = static_cast<int32_t>(
                std::lround(static_cast<double>(intensity) * levels / 255.0));
        }
    }

    const size_t binCount = static_cast<size_t>(levels) + 1;
    std::vector<int32_t> counts(binCount, 0);
    std::vector<int64_t> sumR(binCount, 0), sumG(binCount, 0), sumB(binCount, 0);
    std::vector<int32_t> touched;
    touched.reserve(static_cast<size_t>(2 * radius + 1) * (2 * radius + 1));

    PixelBuffer result(w, h);
    for (int32_t y = 0; y < h; ++y) {
        const int32_t y0 = std::max(0, y - radius);
        const int32_t y1 = std::min(h - 1, y + radius);
        for (int32_t x = 0; x < w; ++x) {
            const int32_t x0 = std::max(0, x - radius);
            const int32_t x1 = std::min(w - 1, x + radius);

            int32_t modeBin = -1;
            int32_t maxCount = 0;

            for (int32_t ny = y0; ny <= y1; ++ny) {
                const Rgba8* row = image.RowPtr(ny);
                const int32_t* binRow = bins.data() + static_cast<size_t>(ny) * w;
                for (int32_t nx = x0; nx <= x1; ++nx) {
                    const int32_t bin = binRow[nx];
                    if (counts[bin] == 0) {
                        touched.push_back(bin);
                    }
                    ++counts[bin];
                    sumR[bin] += row[nx].r;
                    sumG[bin] += row[nx].g;
                    sumB[bin] += row[nx].b;
                    // Strictly greater: a bin that only ties does not take over
                    if (counts[bin] > maxCount) {
                        maxCount = counts[bin];
                        modeBin = bin;
                    }
                }
            }

            const double n = static_cast<double>(maxCount);
            result.SetAt(x, y, Rgba8(ClampU8(sumR[modeBin] / n),
                                     ClampU8(sumG[modeBin] / n),
                                     ClampU8(sumB[modeBin] / n), 255));

            for (int32_t bin : touched) {
                counts[bin] = 0;
                sumR[bin] = sumG[bin] = sumB[bin] = 0;
            }
            touched.clear();
        }
    }
    output = std::move(result);
}

} // namespace Pix::Kit::Filter
