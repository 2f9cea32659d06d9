#pragma once

/**
 * @file ImageCodec.h
 * @brief Encoded bytes <-> PixelBuffer (JPEG / PNG)
 *
 * Decoding always yields 4-channel RGBA. Encoding writes RGB for JPEG
 * (alpha dropped) and RGBA for PNG.
 *
 * Failure policy:
 * - DecodeImage throws DecodeException, TryDecodeImage returns false
 * - EncodeImage throws IOException
 */

#include <PixKit/Core/Export.h>
#include <PixKit/Core/PixelBuffer.h>
#include <PixKit/Core/Types.h>

#include <cstdint>
#include <optional>
#include <string>

namespace Pix::Kit::IO {

// =============================================================================
// Image Format
// =============================================================================

/**
 * @brief Supported encoded formats
 */
enum class ImageFormat {
    JPEG,       ///< Lossy, 8-bit RGB, no alpha
    PNG         ///< Lossless, 8-bit RGBA
};

/// Lower-case format name ("jpeg", "png")
PIXKIT_API const char* GetImageFormatName(ImageFormat format);

/**
 * @brief Parse format name ("jpg", "jpeg", "png", case-insensitive)
 * @throws InvalidArgumentException if unknown
 */
PIXKIT_API ImageFormat ParseImageFormat(const std::string& name);

/**
 * @brief Sniff format from magic bytes
 * @return Format, or std::nullopt if neither JPEG nor PNG
 */
PIXKIT_API std::optional<ImageFormat> DetectFormat(const EncodedImage& bytes);

// =============================================================================
// Memory Codec
// =============================================================================

/**
 * @brief Decode JPEG/PNG bytes
 * @throws DecodeException on corrupt, truncated or unsupported data
 */
PIXKIT_API PixelBuffer DecodeImage(const EncodedImage& bytes);

/**
 * @brief Decode without throwing
 * @param[out] output Decoded buffer, untouched on failure
 * @param[out] error Failure reason (optional)
 * @return true on success
 */
PIXKIT_API bool TryDecodeImage(const EncodedImage& bytes, PixelBuffer& output,
                               std::string* error = nullptr);

/**
 * @brief Encode buffer
 * @param quality JPEG quality [1, 100], ignored for PNG
 * @throws InvalidArgumentException if buffer is empty or quality out of range
 * @throws IOException if the encoder fails
 */
PIXKIT_API EncodedImage EncodeImage(const PixelBuffer& image, ImageFormat format,
                                    int32_t quality = 95);

// =============================================================================
// File Helpers
// =============================================================================

/**
 * @brief Read and decode an image file
 * @throws IOException if the file cannot be read
 * @throws DecodeException if content is not JPEG/PNG
 */
PIXKIT_API PixelBuffer ReadImage(const std::string& path);

/**
 * @brief Encode and write an image file
 * @throws IOException on encode or write failure
 */
PIXKIT_API void WriteImage(const std::string& path, const PixelBuffer& image,
                           ImageFormat format, int32_t quality = 95);

/// Read a whole file into memory
PIXKIT_API EncodedImage ReadFileBytes(const std::string& path);

/// Write bytes to a file, replacing it
PIXKIT_API void WriteFileBytes(const std::string& path, const EncodedImage& bytes);

} // namespace Pix::Kit::IO
