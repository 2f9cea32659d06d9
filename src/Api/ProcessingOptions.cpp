/**
 * @file ProcessingOptions.cpp
 */

#include <PixKit/Api/ProcessingOptions.h>
#include <PixKit/Core/Validate.h>

namespace Pix::Kit::Api {

void ProcessingOptions::Validate() const {
    Validate::RequireRange(jpegQuality, 1, 100, "jpegQuality", "ProcessingOptions");
    Validate::RequireNonNegative(static_cast<int64_t>(acceleratorBudget.count()),
                                 "acceleratorBudget", "ProcessingOptions");
}

IO::ImageFormat ProcessingOptions::FormatFor(const Pipeline::FilterRequest& request) const {
    if (outputFormat) {
        return *outputFormat;
    }
    return request.PrefersPng() ? IO::ImageFormat::PNG : IO::ImageFormat::JPEG;
}

} // namespace Pix::Kit::Api
