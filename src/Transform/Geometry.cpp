/**
 * @file Geometry.cpp
 * @brief Resize, rotate, crop and flip
 */

#include <PixKit/Transform/Geometry.h>
#include <PixKit/Core/Constants.h>
#include <PixKit/Core/Exception.h>
#include <PixKit/Core/Validate.h>
#include <PixKit/Internal/Interpolate.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <string>

namespace Pix::Kit::Transform {

namespace {

// Canvas sizes close to an integer are not rounded up by float noise
constexpr double SIZE_EPSILON = 1e-6;

// Quarter turns for angles that are multiples of 90, -1 otherwise
int32_t QuarterTurns(double degrees) {
    double a = std::fmod(degrees, 360.0);
    if (a < 0.0) a += 360.0;
    double turns = a / 90.0;
    double nearest = std::round(turns);
    if (std::fabs(turns - nearest) * 90.0 > ANGLE_EPSILON) {
        return -1;
    }
    return static_cast<int32_t>(nearest) % 4;
}

// Checked double -> int32 conversion of a computed output dimension
int32_t ToDimension(double v, const char* name, const char* funcName) {
    if (!(v <= static_cast<double>(std::numeric_limits<int32_t>::max()))) {
        throw InvalidArgumentException(std::string(funcName) + ": resulting " + name + " " +
                                       std::to_string(v) + " exceeds the supported size");
    }
    return static_cast<int32_t>(v);
}

int32_t DeriveDimension(int32_t other, int32_t given, int32_t origDim, const char* name) {
    double v = std::round(static_cast<double>(other) * given / origDim);
    return std::max<int32_t>(1, ToDimension(v, name, "Resize"));
}

void RotateQuarter(const PixelBuffer& image, PixelBuffer& output, int32_t turns) {
    const int32_t w = image.Width();
    const int32_t h = image.Height();

    if (turns == 0) {
        output = image;
        return;
    }

    if (turns == 2) {
        PixelBuffer result(w, h);
        for (int32_t y = 0; y < h; ++y) {
            const Rgba8* src = image.RowPtr(h - 1 - y);
            Rgba8* dst = result.RowPtr(y);
            for (int32_t x = 0; x < w; ++x) {
                dst[x] = src[w - 1 - x];
            }
        }
        output = std::move(result);
        return;
    }

    // 90 / 270: dimensions swap
    PixelBuffer result(h, w);
    for (int32_t y = 0; y < w; ++y) {
        Rgba8* dst = result.RowPtr(y);
        for (int32_t x = 0; x < h; ++x) {
            dst[x] = (turns == 1) ? image.At(y, h - 1 - x)
                                  : image.At(w - 1 - y, x);
        }
    }
    output = std::move(result);
}

} // anonymous namespace

// =============================================================================
// Resize
// =============================================================================

Size2i ResolveResizeSize(const Size2i& source,
                         std::optional<int32_t> width,
                         std::optional<int32_t> height) {
    if (!width && !height) {
        throw InvalidArgumentException("Resize: width or height must be given");
    }
    if (width) {
        Validate::RequirePositive(*width, "width", "Resize");
    }
    if (height) {
        Validate::RequirePositive(*height, "height", "Resize");
    }
    if (width && height) {
        return {*width, *height};
    }
    if (source.width <= 0 || source.height <= 0) {
        return {width.value_or(0), height.value_or(0)};
    }
    if (width) {
        return {*width, DeriveDimension(source.height, *width, source.width, "height")};
    }
    return {DeriveDimension(source.width, *height, source.height, "width"), *height};
}

void Resize(const PixelBuffer& image, PixelBuffer& output,
            std::optional<int32_t> width, std::optional<int32_t> height) {
    Size2i target = ResolveResizeSize(image.Size(), width, height);
    if (!Validate::RequireImageValid(image, "Resize")) {
        output = PixelBuffer();
        return;
    }
    if (target == image.Size()) {
        output = image;
        return;
    }

    const double scaleX = static_cast<double>(image.Width()) / target.width;
    const double scaleY = static_cast<double>(image.Height()) / target.height;

    PixelBuffer result(target.width, target.height);
    for (int32_t y = 0; y < target.height; ++y) {
        const double sy = (y + 0.5) * scaleY - 0.5;
        Rgba8* dst = result.RowPtr(y);
        for (int32_t x = 0; x < target.width; ++x) {
            const double sx = (x + 0.5) * scaleX - 0.5;
            dst[x] = Internal::SampleBilinear(image, sx, sy, Internal::BorderMode::Replicate);
        }
    }
    output = std::move(result);
}

// =============================================================================
// Rotate
// =============================================================================

Size2i RotatedSize(const Size2i& source, double degrees) {
    int32_t turns = QuarterTurns(degrees);
    if (turns == 0 || turns == 2) {
        return source;
    }
    if (turns == 1 || turns == 3) {
        return {source.height, source.width};
    }

    const double rad = degrees * DEG_TO_RAD;
    const double c = std::fabs(std::cos(rad));
    const double s = std::fabs(std::sin(rad));
    const double newW = source.width * c + source.height * s;
    const double newH = source.width * s + source.height * c;
    return {ToDimension(std::ceil(newW - SIZE_EPSILON), "width", "Rotate"),
            ToDimension(std::ceil(newH - SIZE_EPSILON), "height", "Rotate")};
}

void Rotate(const PixelBuffer& image, PixelBuffer& output, double degrees) {
    Validate::RequireFinite(degrees, "angle", "Rotate");
    if (!Validate::RequireImageValid(image, "Rotate")) {
        output = PixelBuffer();
        return;
    }

    int32_t turns = QuarterTurns(degrees);
    if (turns >= 0) {
        RotateQuarter(image, output, turns);
        return;
    }

    const Size2i size = RotatedSize(image.Size(), degrees);
    const double rad = degrees * DEG_TO_RAD;
    const double cosA = std::cos(rad);
    const double sinA = std::sin(rad);

    const double srcCx = image.Width() / 2.0;
    const double srcCy = image.Height() / 2.0;
    const double dstCx = size.width / 2.0;
    const double dstCy = size.height / 2.0;
    const Rgba8 transparent(0, 0, 0, 0);

    PixelBuffer result(size.width, size.height, transparent);
    for (int32_t y = 0; y < size.height; ++y) {
        const double dy = y + 0.5 - dstCy;
        Rgba8* dst = result.RowPtr(y);
        for (int32_t x = 0; x < size.width; ++x) {
            const double dx = x + 0.5 - dstCx;
            // Inverse of a clockwise (y-down) rotation
            const double u = dx * cosA + dy * sinA;
            const double v = -dx * sinA + dy * cosA;
            const double sx = u + srcCx - 0.5;
            const double sy = v + srcCy - 0.5;
            if (sx <= -1.0 || sy <= -1.0 || sx >= image.Width() || sy >= image.Height()) {
                continue;
            }
            dst[x] = Internal::SampleBilinear(image, sx, sy,
                                              Internal::BorderMode::Constant, transparent);
        }
    }
    output = std::move(result);
}

// =============================================================================
// Crop / Flip
// =============================================================================

void Crop(const PixelBuffer& image, PixelBuffer& output,
          int32_t x, int32_t y, int32_t width, int32_t height) {
    Validate::RequireNonNegative(x, "x", "Crop");
    Validate::RequireNonNegative(y, "y", "Crop");
    Validate::RequirePositive(width, "width", "Crop");
    Validate::RequirePositive(height, "height", "Crop");
    if (!Validate::RequireImageValid(image, "Crop")) {
        output = PixelBuffer();
        return;
    }

    if (static_cast<int64_t>(x) + width > image.Width() ||
        static_cast<int64_t>(y) + height > image.Height()) {
        throw InvalidArgumentException(
            "Crop: rectangle (" + std::to_string(x) + ", " + std::to_string(y) + ", " +
            std::to_string(width) + ", " + std::to_string(height) +
            ") exceeds image " + std::to_string(image.Width()) + "x" +
            std::to_string(image.Height()));
    }

    PixelBuffer result(width, height);
    for (int32_t row = 0; row < height; ++row) {
        const Rgba8* src = image.RowPtr(y + row) + x;
        std::copy(src, src + width, result.RowPtr(row));
    }
    output = std::move(result);
}

FlipMode ParseFlipMode(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "none") return FlipMode::None;
    if (lower == "horizontal" || lower == "h" || lower == "column") return FlipMode::Horizontal;
    if (lower == "vertical" || lower == "v" || lower == "row") return FlipMode::Vertical;
    if (lower == "both" || lower == "hv") return FlipMode::Both;

    throw InvalidArgumentException("Unknown flip mode: " + name);
}

FlipMode MakeFlipMode(bool horizontal, bool vertical) {
    if (horizontal && vertical) return FlipMode::Both;
    if (horizontal) return FlipMode::Horizontal;
    if (vertical) return FlipMode::Vertical;
    return FlipMode::None;
}

void Flip(const PixelBuffer& image, PixelBuffer& output, bool horizontal, bool vertical) {
    if (!Validate::RequireImageValid(image, "Flip")) {
        output = PixelBuffer();
        return;
    }

    const int32_t w = image.Width();
    const int32_t h = image.Height();

    PixelBuffer result(w, h);
    for (int32_t y = 0; y < h; ++y) {
        const Rgba8* src = image.RowPtr(vertical ? h - 1 - y : y);
        Rgba8* dst = result.RowPtr(y);
        if (horizontal) {
            std::reverse_copy(src, src + w, dst);
        } else {
            std::copy(src, src + w, dst);
        }
    }
    output = std::move(result);
}

void Flip(const PixelBuffer& image, PixelBuffer& output, FlipMode mode) {
    Flip(image, output,
         mode == FlipMode::Horizontal || mode == FlipMode::Both,
         mode == FlipMode::Vertical || mode == FlipMode::Both);
}

} // namespace Pix::Kit::Transform
