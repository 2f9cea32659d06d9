/**
 * @file FilterRequest.cpp
 * @brief Filter names, parameter validation and accelerator parameter maps
 */

#include <PixKit/Pipeline/FilterRequest.h>
#include <PixKit/Core/Exception.h>
#include <PixKit/Core/Validate.h>
#include <PixKit/Transform/Geometry.h>

namespace Pix::Kit::Pipeline {

static_assert(std::variant_size_v<FilterParams> ==
                  static_cast<size_t>(FilterKind::DrawDetections) + 1,
              "FilterParams alternatives must follow FilterKind order");

// =============================================================================
// Names
// =============================================================================

const char* GetOperationName(FilterKind kind) {
    switch (kind) {
        case FilterKind::Grayscale: return "applyGrayscale";
        case FilterKind::Blur: return "applyBlur";
        case FilterKind::Brightness: return "adjustBrightness";
        case FilterKind::Sepia: return "applySepia";
        case FilterKind::Invert: return "applyInvert";
        case FilterKind::Vignette: return "applyVignette";
        case FilterKind::Watercolor: return "applyWatercolor";
        case FilterKind::OilPainting: return "applyOilPainting";
        case FilterKind::Contrast: return "adjustContrast";
        case FilterKind::Saturation: return "adjustSaturation";
        case FilterKind::Resize: return "applyResize";
        case FilterKind::Rotate: return "applyRotate";
        case FilterKind::Crop: return "applyCrop";
        case FilterKind::Flip: return "applyFlip";
        case FilterKind::Watermark: return "applyWatermark";
        case FilterKind::DrawDetections: return "drawDetections";
        default: return "unknown";
    }
}

const char* GetStageName(FilterKind kind) {
    switch (kind) {
        case FilterKind::Grayscale: return "grayscale";
        case FilterKind::Blur: return "blur";
        case FilterKind::Brightness: return "brightness";
        case FilterKind::Sepia: return "sepia";
        case FilterKind::Invert: return "invert";
        case FilterKind::Vignette: return "vignette";
        case FilterKind::Watercolor: return "watercolor";
        case FilterKind::OilPainting: return "oil_painting";
        case FilterKind::Contrast: return "contrast";
        case FilterKind::Saturation: return "saturation";
        case FilterKind::Resize: return "resize";
        case FilterKind::Rotate: return "rotate";
        case FilterKind::Crop: return "crop";
        case FilterKind::Flip: return "flip";
        case FilterKind::Watermark: return "watermark";
        case FilterKind::DrawDetections: return "detections";
        default: return "unknown";
    }
}

// =============================================================================
// FilterRequest
// =============================================================================

FilterKind FilterRequest::Kind() const {
    return static_cast<FilterKind>(params_.index());
}

void FilterRequest::Validate() const {
    switch (Kind()) {
        case FilterKind::Blur: {
            const auto& p = std::get<BlurParams>(params_);
            Validate::RequireFinite(p.sigma, "sigma", "GaussBlur");
            Validate::RequireNonNegative(p.sigma, "sigma", "GaussBlur");
            break;
        }
        case FilterKind::Brightness: {
            const auto& p = std::get<BrightnessParams>(params_);
            Validate::RequireRange(p.factor, -1.0, 1.0, "factor", "AdjustBrightness");
            break;
        }
        case FilterKind::Vignette: {
            const auto& p = std::get<VignetteParams>(params_);
            Validate::RequireFinite(p.intensity, "intensity", "Vignette");
            Validate::RequireFinite(p.radius, "radius", "Vignette");
            break;
        }
        case FilterKind::Watercolor: {
            const auto& p = std::get<WatercolorParams>(params_);
            Validate::RequireNonNegative(p.radius, "radius", "Watercolor");
            break;
        }
        case FilterKind::OilPainting: {
            const auto& p = std::get<OilPaintingParams>(params_);
            Validate::RequireNonNegative(p.radius, "radius", "OilPainting");
            Validate::RequireMin(p.levels, 1, "levels", "OilPainting");
            break;
        }
        case FilterKind::Contrast: {
            const auto& p = std::get<ContrastParams>(params_);
            Validate::RequireFinite(p.factor, "factor", "AdjustContrast");
            Validate::RequireNonNegative(p.factor, "factor", "AdjustContrast");
            break;
        }
        case FilterKind::Saturation: {
            const auto& p = std::get<SaturationParams>(params_);
            Validate::RequireFinite(p.factor, "factor", "AdjustSaturation");
            Validate::RequireNonNegative(p.factor, "factor", "AdjustSaturation");
            break;
        }
        case FilterKind::Resize: {
            const auto& p = std::get<ResizeParams>(params_);
            // Source size is unknown here, only the given dimensions are checked
            Transform::ResolveResizeSize(Size2i(), p.width, p.height);
            break;
        }
        case FilterKind::Rotate: {
            const auto& p = std::get<RotateParams>(params_);
            Validate::RequireFinite(p.degrees, "angle", "Rotate");
            break;
        }
        case FilterKind::Crop: {
            const auto& p = std::get<CropParams>(params_);
            Validate::RequireNonNegative(p.x, "x", "Crop");
            Validate::RequireNonNegative(p.y, "y", "Crop");
            Validate::RequirePositive(p.width, "width", "Crop");
            Validate::RequirePositive(p.height, "height", "Crop");
            break;
        }
        case FilterKind::Watermark: {
            const auto& p = std::get<WatermarkParams>(params_);
            Validate::RequireRange(p.opacity, 0.0, 1.0, "opacity", "Watermark");
            break;
        }
        default:
            break;
    }
}

Accel::ParamMap FilterRequest::ToParamMap() const {
    Accel::ParamMap map;
    switch (Kind()) {
        case FilterKind::Blur:
            map["sigma"] = std::get<BlurParams>(params_).sigma;
            break;
        case FilterKind::Brightness:
            map["factor"] = std::get<BrightnessParams>(params_).factor;
            break;
        case FilterKind::Vignette: {
            const auto& p = std::get<VignetteParams>(params_);
            map["intensity"] = p.intensity;
            map["radius"] = p.radius;
            break;
        }
        case FilterKind::Watercolor:
            map["radius"] = static_cast<int64_t>(std::get<WatercolorParams>(params_).radius);
            break;
        case FilterKind::OilPainting: {
            const auto& p = std::get<OilPaintingParams>(params_);
            map["radius"] = static_cast<int64_t>(p.radius);
            map["levels"] = static_cast<int64_t>(p.levels);
            break;
        }
        case FilterKind::Contrast:
            map["factor"] = std::get<ContrastParams>(params_).factor;
            break;
        case FilterKind::Saturation:
            map["factor"] = std::get<SaturationParams>(params_).factor;
            break;
        case FilterKind::Resize: {
            const auto& p = std::get<ResizeParams>(params_);
            if (p.width) map["width"] = static_cast<int64_t>(*p.width);
            if (p.height) map["height"] = static_cast<int64_t>(*p.height);
            break;
        }
        case FilterKind::Rotate:
            map["angle"] = std::get<RotateParams>(params_).degrees;
            break;
        case FilterKind::Crop: {
            const auto& p = std::get<CropParams>(params_);
            map["x"] = static_cast<int64_t>(p.x);
            map["y"] = static_cast<int64_t>(p.y);
            map["width"] = static_cast<int64_t>(p.width);
            map["height"] = static_cast<int64_t>(p.height);
            break;
        }
        case FilterKind::Flip: {
            const auto& p = std::get<FlipParams>(params_);
            map["horizontal"] = p.horizontal;
            map["vertical"] = p.vertical;
            break;
        }
        case FilterKind::Watermark: {
            const auto& p = std::get<WatermarkParams>(params_);
            map["watermark"] = p.watermark;
            map["x"] = static_cast<int64_t>(p.x);
            map["y"] = static_cast<int64_t>(p.y);
            map["opacity"] = p.opacity;
            break;
        }
        case FilterKind::DrawDetections:
            map["detections"] = std::get<DrawDetectionsParams>(params_).detections;
            break;
        default:
            break;
    }
    return map;
}

} // namespace Pix::Kit::Pipeline
