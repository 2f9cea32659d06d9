/**
 * @file KernelDispatch.cpp
 * @brief FilterRequest -> kernel call
 */

#include <PixKit/Pipeline/KernelDispatch.h>
#include <PixKit/Compose/Compose.h>
#include <PixKit/Filter/Filter.h>
#include <PixKit/IO/ImageCodec.h>
#include <PixKit/Platform/Log.h>
#include <PixKit/Transform/Geometry.h>

#include <string>
#include <type_traits>

namespace Pix::Kit::Pipeline {

namespace {

template<typename T>
inline constexpr bool always_false_v = false;

void ApplyWatermark(const PixelBuffer& image, PixelBuffer& output, const WatermarkParams& p) {
    PixelBuffer mark;
    std::string error;
    if (!IO::TryDecodeImage(p.watermark, mark, &error)) {
        Compose::Watermark(image, PixelBuffer(), output, p.x, p.y, p.opacity);
        Platform::LogWarning("Pipeline", "watermark not decodable, image left unchanged: " + error);
        return;
    }
    Compose::Watermark(image, mark, output, p.x, p.y, p.opacity);
}

} // anonymous namespace

void ApplyKernel(const PixelBuffer& image, PixelBuffer& output, const FilterRequest& request) {
    std::visit([&](const auto& p) {
        using P = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<P, GrayscaleParams>) {
            Filter::Grayscale(image, output);
        } else if constexpr (std::is_same_v<P, BlurParams>) {
            Filter::GaussBlur(image, output, p.sigma);
        } else if constexpr (std::is_same_v<P, BrightnessParams>) {
            Filter::AdjustBrightness(image, output, p.factor);
        } else if constexpr (std::is_same_v<P, SepiaParams>) {
            Filter::Sepia(image, output);
        } else if constexpr (std::is_same_v<P, InvertParams>) {
            Filter::Invert(image, output);
        } else if constexpr (std::is_same_v<P, VignetteParams>) {
            Filter::Vignette(image, output, p.intensity, p.radius);
        } else if constexpr (std::is_same_v<P, WatercolorParams>) {
            Filter::Watercolor(image, output, p.radius);
        } else if constexpr (std::is_same_v<P, OilPaintingParams>) {
            Filter::OilPainting(image, output, p.radius, p.levels);
        } else if constexpr (std::is_same_v<P, ContrastParams>) {
            Filter::AdjustContrast(image, output, p.factor);
        } else if constexpr (std::is_same_v<P, SaturationParams>) {
            Filter::AdjustSaturation(image, output, p.factor);
        } else if constexpr (std::is_same_v<P, ResizeParams>) {
            Transform::Resize(image, output, p.width, p.height);
        } else if constexpr (std::is_same_v<P, RotateParams>) {
            Transform::Rotate(image, output, p.degrees);
        } else if constexpr (std::is_same_v<P, CropParams>) {
            Transform::Crop(image, output, p.x, p.y, p.width, p.height);
        } else if constexpr (std::is_same_v<P, FlipParams>) {
            Transform::Flip(image, output, p.horizontal, p.vertical);
        } else if constexpr (std::is_same_v<P, WatermarkParams>) {
            ApplyWatermark(image, output, p);
        } else if constexpr (std::is_same_v<P, DrawDetectionsParams>) {
            Compose::DrawDetections(image, output, p.detections);
        } else {
            static_assert(always_false_v<P>, "unhandled filter parameters");
        }
    }, request.Params());
}

} // namespace Pix::Kit::Pipeline
