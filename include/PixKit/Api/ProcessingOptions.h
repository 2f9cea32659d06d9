#pragma once

/**
 * @file ProcessingOptions.h
 * @brief Configuration of the byte-level processing API
 */

#include <PixKit/Accel/Accelerator.h>
#include <PixKit/Core/Constants.h>
#include <PixKit/Core/Export.h>
#include <PixKit/IO/ImageCodec.h>
#include <PixKit/Pipeline/FilterRequest.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace Pix::Kit::Api {

/**
 * @brief Output encoding, accelerator budget and worker count
 */
struct PIXKIT_API ProcessingOptions {
    /// Output format; empty = JPEG, or PNG for watermark requests
    std::optional<IO::ImageFormat> outputFormat;

    /// JPEG quality [1, 100]
    int32_t jpegQuality = DEFAULT_JPEG_QUALITY;

    /// Maximum wait on the accelerator per call (0 = inline, no timeout)
    std::chrono::milliseconds acceleratorBudget = Accel::DEFAULT_ACCELERATOR_BUDGET;

    /// Worker threads for async and batch calls (0 = recommended count)
    size_t workerThreads = 0;

    /**
     * @throws InvalidArgumentException on out-of-range values
     */
    void Validate() const;

    /// Output format for a request after defaults are applied
    IO::ImageFormat FormatFor(const Pipeline::FilterRequest& request) const;
};

} // namespace Pix::Kit::Api
