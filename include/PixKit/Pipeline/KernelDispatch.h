#pragma once

/**
 * @file KernelDispatch.h
 * @brief Route a FilterRequest to its built-in kernel
 */

#include <PixKit/Core/Export.h>
#include <PixKit/Core/PixelBuffer.h>
#include <PixKit/Pipeline/FilterRequest.h>

namespace Pix::Kit::Pipeline {

/**
 * @brief Run the built-in kernel for a request
 *
 * A watermark whose bytes cannot be decoded leaves the image unchanged
 * (warning logged).
 *
 * @throws InvalidArgumentException on invalid parameters
 */
PIXKIT_API void ApplyKernel(const PixelBuffer& image, PixelBuffer& output,
                            const FilterRequest& request);

} // namespace Pix::Kit::Pipeline
