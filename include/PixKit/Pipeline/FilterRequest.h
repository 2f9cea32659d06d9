#pragma once

/**
 * @file FilterRequest.h
 * @brief Named filter operation with typed parameters
 *
 * One parameter struct per filter, gathered in a variant. Defaults match the
 * byte-level API defaults.
 *
 * @code
 * FilterRequest blur(BlurParams{2.0});
 * blur.Validate();
 * auto params = blur.ToParamMap();   // {"sigma": 2.0}
 * std::string op = blur.Name();      // "applyBlur"
 * @endcode
 */

#include <PixKit/Accel/Accelerator.h>
#include <PixKit/Core/Export.h>
#include <PixKit/Core/Types.h>
#include <PixKit/Detection/DetectedObject.h>

#include <cstdint>
#include <optional>
#include <type_traits>
#include <string>
#include <variant>
#include <vector>

namespace Pix::Kit::Pipeline {

// =============================================================================
// Filter Kinds
// =============================================================================

enum class FilterKind {
    Grayscale,
    Blur,
    Brightness,
    Sepia,
    Invert,
    Vignette,
    Watercolor,
    OilPainting,
    Contrast,
    Saturation,
    Resize,
    Rotate,
    Crop,
    Flip,
    Watermark,
    DrawDetections
};

/// Accelerator operation name, e.g. "applyBlur"
PIXKIT_API const char* GetOperationName(FilterKind kind);

/// Chain stage name, e.g. "blur", "oil_painting"
PIXKIT_API const char* GetStageName(FilterKind kind);

// =============================================================================
// Parameter Structs
// =============================================================================

struct PIXKIT_API GrayscaleParams {};

struct PIXKIT_API BlurParams {
    double sigma = 5.0;
};

struct PIXKIT_API BrightnessParams {
    double factor = 0.0;            ///< [-1, 1]
};

struct PIXKIT_API SepiaParams {};

struct PIXKIT_API InvertParams {};

struct PIXKIT_API VignetteParams {
    double intensity = 0.5;
    double radius = 0.5;
};

struct PIXKIT_API WatercolorParams {
    int32_t radius = 5;
};

struct PIXKIT_API OilPaintingParams {
    int32_t radius = 4;
    int32_t levels = 20;
};

struct PIXKIT_API ContrastParams {
    double factor = 1.0;
};

struct PIXKIT_API SaturationParams {
    double factor = 1.0;
};

struct PIXKIT_API ResizeParams {
    std::optional<int32_t> width;
    std::optional<int32_t> height;
};

struct PIXKIT_API RotateParams {
    double degrees = 0.0;           ///< Clockwise
};

struct PIXKIT_API CropParams {
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;
};

struct PIXKIT_API FlipParams {
    bool horizontal = false;
    bool vertical = false;
};

struct PIXKIT_API WatermarkParams {
    EncodedImage watermark;         ///< Encoded JPEG/PNG
    int32_t x = 0;
    int32_t y = 0;
    double opacity = 1.0;
};

struct PIXKIT_API DrawDetectionsParams {
    std::vector<Detection::DetectedObject> detections;
};

using FilterParams = std::variant<
    GrayscaleParams, BlurParams, BrightnessParams, SepiaParams, InvertParams,
    VignetteParams, WatercolorParams, OilPaintingParams, ContrastParams,
    SaturationParams, ResizeParams, RotateParams, CropParams, FlipParams,
    WatermarkParams, DrawDetectionsParams>;

// =============================================================================
// FilterRequest
// =============================================================================

/**
 * @brief Immutable request for one filter invocation
 */
class PIXKIT_API FilterRequest {
public:
    FilterRequest() = default;

    template<typename P,
             typename = std::enable_if_t<std::is_constructible_v<FilterParams, P>>>
    FilterRequest(P params) : params_(std::move(params)) {}

    FilterKind Kind() const;

    /// Accelerator operation name
    std::string Name() const { return GetOperationName(Kind()); }

    const FilterParams& Params() const { return params_; }

    /// Typed access, nullptr if the request holds another filter
    template<typename P>
    const P* Get() const { return std::get_if<P>(&params_); }

    /**
     * @brief Check static parameter ranges (no image needed)
     * @throws InvalidArgumentException
     */
    void Validate() const;

    /// Parameters keyed for the accelerator
    Accel::ParamMap ToParamMap() const;

    /// Whether the default output format is PNG (alpha matters)
    bool PrefersPng() const { return Kind() == FilterKind::Watermark; }

private:
    FilterParams params_;
};

} // namespace Pix::Kit::Pipeline
