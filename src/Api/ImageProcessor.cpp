/**
 * @file ImageProcessor.cpp
 * @brief Byte-level API over the fallback controller and kernels
 */

#include <PixKit/Api/ImageProcessor.h>
#include <PixKit/Core/Exception.h>
#include <PixKit/IO/ImageCodec.h>
#include <PixKit/Pipeline/KernelDispatch.h>
#include <PixKit/Platform/Log.h>

#include <utility>

namespace Pix::Kit::Api {

using namespace Pipeline;

namespace {

const char* TAG = "Processor";

const ProcessingOptions& Validated(const ProcessingOptions& options) {
    options.Validate();
    return options;
}

} // anonymous namespace

ImageProcessor::ImageProcessor(ProcessingOptions options,
                               std::shared_ptr<Accel::Accelerator> accelerator)
    : options_(Validated(options))
    , controller_(std::move(accelerator), options_.acceleratorBudget)
    , pool_(std::make_unique<Platform::ThreadPool>(options_.workerThreads))
{
}

ImageProcessor::~ImageProcessor() = default;

// =============================================================================
// Generic Entry Points
// =============================================================================

EncodedImage ImageProcessor::ApplyLocal(const EncodedImage& image,
                                        const FilterRequest& request) const {
    PixelBuffer decoded;
    std::string error;
    if (!IO::TryDecodeImage(image, decoded, &error)) {
        Platform::LogWarning(TAG, request.Name() + ": input not decodable, "
                             "returning original bytes: " + error);
        return image;
    }

    PixelBuffer result;
    ApplyKernel(decoded, result, request);

    try {
        return IO::EncodeImage(result, options_.FormatFor(request), options_.jpegQuality);
    } catch (const IOException& e) {
        Platform::LogWarning(TAG, request.Name() + ": encode failed, returning original bytes: " +
                             e.what());
        return image;
    }
}

Accel::FallbackResult ImageProcessor::ApplyWithStatus(const EncodedImage& image,
                                                      const FilterRequest& request) const {
    request.Validate();
    return controller_.Run(request.Name(), request.ToParamMap(), image,
                           [this, &image, &request]() { return ApplyLocal(image, request); });
}

EncodedImage ImageProcessor::Apply(const EncodedImage& image, const FilterRequest& request) const {
    return ApplyWithStatus(image, request).bytes;
}

std::future<EncodedImage> ImageProcessor::ApplyAsync(EncodedImage image, FilterRequest request) {
    return pool_->Submit([this, image = std::move(image), request = std::move(request)]() {
        return Apply(image, request);
    });
}

std::vector<EncodedImage> ImageProcessor::ApplyBatch(const std::vector<EncodedImage>& images,
                                                     const FilterRequest& request) {
    request.Validate();

    std::vector<EncodedImage> results(images.size());
    Platform::ParallelFor(*pool_, 0, images.size(), [&](size_t i) {
        results[i] = Apply(images[i], request);
    });
    return results;
}

EncodedImage ImageProcessor::RunPipeline(const EncodedImage& image,
                                         const FilterPipeline& pipeline) const {
    EncodeOptions encode;
    encode.format = options_.outputFormat;
    encode.jpegQuality = options_.jpegQuality;
    return pipeline.Run(image, encode);
}

EncodedImage ImageProcessor::RunChained(const EncodedImage& image,
                                        const std::vector<FilterRequest>& requests) const {
    for (const auto& request : requests) {
        request.Validate();
    }

    EncodedImage current = image;
    for (size_t i = 0; i < requests.size(); ++i) {
        try {
            current = Apply(current, requests[i]);
        } catch (const std::exception& e) {
            Platform::LogError(TAG, "chain stage " + std::to_string(i) + " (" +
                               requests[i].Name() + ") failed: " + e.what());
            throw;
        }
    }
    return current;
}

// =============================================================================
// Per-Filter Operations
// =============================================================================

std::future<EncodedImage> ImageProcessor::ApplyGrayscale(EncodedImage image) {
    return ApplyAsync(std::move(image), GrayscaleParams{});
}

std::future<EncodedImage> ImageProcessor::ApplyBlur(EncodedImage image, double sigma) {
    return ApplyAsync(std::move(image), BlurParams{sigma});
}

std::future<EncodedImage> ImageProcessor::AdjustBrightness(EncodedImage image, double factor) {
    return ApplyAsync(std::move(image), BrightnessParams{factor});
}

std::future<EncodedImage> ImageProcessor::ApplySepia(EncodedImage image) {
    return ApplyAsync(std::move(image), SepiaParams{});
}

std::future<EncodedImage> ImageProcessor::ApplyInvert(EncodedImage image) {
    return ApplyAsync(std::move(image), InvertParams{});
}

std::future<EncodedImage> ImageProcessor::ApplyVignette(EncodedImage image, double intensity,
                                                        double radius) {
    return ApplyAsync(std::move(image), VignetteParams{intensity, radius});
}

std::future<EncodedImage> ImageProcessor::ApplyWatercolor(EncodedImage image, int32_t radius) {
    return ApplyAsync(std::move(image), WatercolorParams{radius});
}

std::future<EncodedImage> ImageProcessor::ApplyOilPainting(EncodedImage image, int32_t radius,
                                                           int32_t levels) {
    return ApplyAsync(std::move(image), OilPaintingParams{radius, levels});
}

std::future<EncodedImage> ImageProcessor::AdjustContrast(EncodedImage image, double factor) {
    return ApplyAsync(std::move(image), ContrastParams{factor});
}

std::future<EncodedImage> ImageProcessor::AdjustSaturation(EncodedImage image, double factor) {
    return ApplyAsync(std::move(image), SaturationParams{factor});
}

std::future<EncodedImage> ImageProcessor::ApplyResize(EncodedImage image,
                                                      std::optional<int32_t> width,
                                                      std::optional<int32_t> height) {
    return ApplyAsync(std::move(image), ResizeParams{width, height});
}

std::future<EncodedImage> ImageProcessor::ApplyRotate(EncodedImage image, double degrees) {
    return ApplyAsync(std::move(image), RotateParams{degrees});
}

std::future<EncodedImage> ImageProcessor::ApplyCrop(EncodedImage image, int32_t x, int32_t y,
                                                    int32_t width, int32_t height) {
    return ApplyAsync(std::move(image), CropParams{x, y, width, height});
}

std::future<EncodedImage> ImageProcessor::ApplyFlip(EncodedImage image, bool horizontal,
                                                    bool vertical) {
    return ApplyAsync(std::move(image), FlipParams{horizontal, vertical});
}

std::future<EncodedImage> ImageProcessor::ApplyWatermark(EncodedImage image,
                                                         EncodedImage watermark,
                                                         int32_t x, int32_t y, double opacity) {
    return ApplyAsync(std::move(image), WatermarkParams{std::move(watermark), x, y, opacity});
}

std::future<EncodedImage> ImageProcessor::DrawDetections(
    EncodedImage image, std::vector<Detection::DetectedObject> detections) {
    return ApplyAsync(std::move(image), DrawDetectionsParams{std::move(detections)});
}

} // namespace Pix::Kit::Api
