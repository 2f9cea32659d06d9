#pragma once

/**
 * @file ImageProcessor.h
 * @brief Byte-to-byte, asynchronous filter API
 *
 * Every call takes encoded JPEG/PNG bytes and produces encoded bytes:
 * - the accelerator (if any) is tried first, the built-in kernel otherwise
 * - undecodable input, or an output that cannot be encoded, yields the
 *   original bytes (warning logged)
 * - invalid parameters throw InvalidArgumentException (through the future
 *   for the async forms)
 *
 * @code
 * ImageProcessor processor;
 * auto gray = processor.ApplyGrayscale(jpegBytes);
 * EncodedImage out = gray.get();
 *
 * EncodedImage small = processor.Apply(jpegBytes, ResizeParams{320, std::nullopt});
 * @endcode
 */

#include <PixKit/Accel/Accelerator.h>
#include <PixKit/Accel/FallbackController.h>
#include <PixKit/Api/ProcessingOptions.h>
#include <PixKit/Core/Export.h>
#include <PixKit/Core/Types.h>
#include <PixKit/Detection/DetectedObject.h>
#include <PixKit/Pipeline/FilterPipeline.h>
#include <PixKit/Pipeline/FilterRequest.h>
#include <PixKit/Platform/Thread.h>

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace Pix::Kit::Api {

using Pipeline::FilterRequest;

class PIXKIT_API ImageProcessor {
public:
    /**
     * @param options Output encoding, budget, worker count (validated)
     * @param accelerator Backend tried before the built-in kernels (nullptr = none)
     */
    explicit ImageProcessor(ProcessingOptions options = ProcessingOptions(),
                            std::shared_ptr<Accel::Accelerator> accelerator = nullptr);

    /// Waits for queued async work
    ~ImageProcessor();

    ImageProcessor(const ImageProcessor&) = delete;
    ImageProcessor& operator=(const ImageProcessor&) = delete;

    const ProcessingOptions& Options() const { return options_; }

    // =========================================================================
    // Generic Entry Points
    // =========================================================================

    /**
     * @brief Run one filter synchronously
     * @throws InvalidArgumentException on invalid parameters
     */
    EncodedImage Apply(const EncodedImage& image, const FilterRequest& request) const;

    /// Apply() that also reports whether the accelerator handled the call
    Accel::FallbackResult ApplyWithStatus(const EncodedImage& image,
                                          const FilterRequest& request) const;

    /// Apply() on the worker pool
    std::future<EncodedImage> ApplyAsync(EncodedImage image, FilterRequest request);

    /**
     * @brief Apply one filter to many images in parallel, one image per task
     *
     * Result order matches input order. Must not be called from a task on
     * this processor's own pool.
     */
    std::vector<EncodedImage> ApplyBatch(const std::vector<EncodedImage>& images,
                                         const FilterRequest& request);

    /**
     * @brief In-process chain: decode once, run all stages, encode once
     *
     * The accelerator is not consulted.
     */
    EncodedImage RunPipeline(const EncodedImage& image,
                             const Pipeline::FilterPipeline& pipeline) const;

    /**
     * @brief Byte-level chain: each stage is a full Apply() call
     *
     * The accelerator is tried per stage.
     */
    EncodedImage RunChained(const EncodedImage& image,
                            const std::vector<FilterRequest>& requests) const;

    // =========================================================================
    // Per-Filter Operations (asynchronous)
    // =========================================================================

    std::future<EncodedImage> ApplyGrayscale(EncodedImage image);
    std::future<EncodedImage> ApplyBlur(EncodedImage image, double sigma);
    std::future<EncodedImage> AdjustBrightness(EncodedImage image, double factor);
    std::future<EncodedImage> ApplySepia(EncodedImage image);
    std::future<EncodedImage> ApplyInvert(EncodedImage image);
    std::future<EncodedImage> ApplyVignette(EncodedImage image, double intensity = 0.5,
                                            double radius = 0.5);
    std::future<EncodedImage> ApplyWatercolor(EncodedImage image, int32_t radius = 5);
    std::future<EncodedImage> ApplyOilPainting(EncodedImage image, int32_t radius = 4,
                                               int32_t levels = 20);
    std::future<EncodedImage> AdjustContrast(EncodedImage image, double factor);
    std::future<EncodedImage> AdjustSaturation(EncodedImage image, double factor);

    /// Missing dimension follows the aspect ratio
    std::future<EncodedImage> ApplyResize(EncodedImage image, std::optional<int32_t> width,
                                          std::optional<int32_t> height);

    /// Clockwise, in degrees
    std::future<EncodedImage> ApplyRotate(EncodedImage image, double degrees);

    std::future<EncodedImage> ApplyCrop(EncodedImage image, int32_t x, int32_t y,
                                        int32_t width, int32_t height);
    std::future<EncodedImage> ApplyFlip(EncodedImage image, bool horizontal, bool vertical);

    /// Output defaults to PNG
    std::future<EncodedImage> ApplyWatermark(EncodedImage image, EncodedImage watermark,
                                             int32_t x = 0, int32_t y = 0,
                                             double opacity = 1.0);

    std::future<EncodedImage> DrawDetections(
        EncodedImage image, std::vector<Detection::DetectedObject> detections);

private:
    EncodedImage ApplyLocal(const EncodedImage& image, const FilterRequest& request) const;

    ProcessingOptions options_;
    Accel::FallbackController controller_;
    // Declared last: workers are joined before the members they use go away
    std::unique_ptr<Platform::ThreadPool> pool_;
};

} // namespace Pix::Kit::Api
