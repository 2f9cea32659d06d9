#pragma once

/**
 * @file FilterPipeline.h
 * @brief Ordered chain of filters run on one decoded buffer
 *
 * Decodes once at entry and encodes once at exit. A failing stage aborts the
 * run (stage index and name logged) and the error propagates; there is no
 * partial result.
 *
 * Chain text syntax: stages separated by '|', each "name[:key=value,...]"
 * @code
 * auto pipeline = ParseFilterChain("grayscale|blur:sigma=2|crop:x=10,y=10,width=50,height=50");
 * EncodedImage out = pipeline.Run(jpegBytes);
 * @endcode
 */

#include <PixKit/Core/Export.h>
#include <PixKit/Core/PixelBuffer.h>
#include <PixKit/Core/Types.h>
#include <PixKit/IO/ImageCodec.h>
#include <PixKit/Pipeline/FilterRequest.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Pix::Kit::Pipeline {

/**
 * @brief Encoding of the final pipeline output
 */
struct PIXKIT_API EncodeOptions {
    std::optional<IO::ImageFormat> format;     ///< Empty = JPEG, PNG if a stage needs alpha
    int32_t jpegQuality = 95;
};

class PIXKIT_API FilterPipeline {
public:
    FilterPipeline() = default;
    explicit FilterPipeline(std::vector<FilterRequest> stages);

    /// Append a stage
    FilterPipeline& Add(FilterRequest request);

    const std::vector<FilterRequest>& Stages() const { return stages_; }
    size_t Size() const { return stages_.size(); }
    bool Empty() const { return stages_.empty(); }

    /// Whether the default output format is PNG
    bool PrefersPng() const;

    /**
     * @brief Check every stage's static parameters
     * @throws InvalidArgumentException from the first bad stage (stage logged)
     */
    void Validate() const;

    /**
     * @brief Run all stages in order on a decoded buffer
     * @throws InvalidArgumentException from validation or a stage
     */
    void Run(const PixelBuffer& image, PixelBuffer& output) const;

    /**
     * @brief Decode, run, encode
     *
     * Undecodable input, or a result that cannot be encoded, returns the
     * input bytes unchanged (warning logged).
     */
    EncodedImage Run(const EncodedImage& image,
                     const EncodeOptions& options = EncodeOptions()) const;

private:
    std::vector<FilterRequest> stages_;
};

// =============================================================================
// Chain Parsing
// =============================================================================

/**
 * @brief Parse one stage, e.g. "blur:sigma=2"
 * @throws InvalidArgumentException on unknown names/keys or bad values
 */
PIXKIT_API FilterRequest ParseFilterStage(const std::string& stage);

/**
 * @brief Parse a '|' separated chain into a validated pipeline
 * @throws InvalidArgumentException
 */
PIXKIT_API FilterPipeline ParseFilterChain(const std::string& chain);

} // namespace Pix::Kit::Pipeline
