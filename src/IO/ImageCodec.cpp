/**
 * @file ImageCodec.cpp
 * @brief stb_image based codec
 */

#include <PixKit/IO/ImageCodec.h>
#include <PixKit/Core/Exception.h>
#include <PixKit/Core/Validate.h>
#include <PixKit/Platform/Log.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>

// stb_image for memory decode / encode
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STBI_ONLY_JPEG
#define STBI_ONLY_PNG
#include <stb/stb_image.h>
#include <stb/stb_image_write.h>

namespace Pix::Kit::IO {

namespace {

const char* TAG = "Codec";

constexpr uint8_t PNG_MAGIC[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
constexpr uint8_t JPEG_MAGIC[3] = {0xFF, 0xD8, 0xFF};

// stbi_write_*_to_func callback, appends to an EncodedImage
void AppendBytes(void* context, void* data, int size) {
    auto* out = static_cast<EncodedImage*>(context);
    const auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // anonymous namespace

// =============================================================================
// Image Format
// =============================================================================

const char* GetImageFormatName(ImageFormat format) {
    switch (format) {
        case ImageFormat::JPEG: return "jpeg";
        case ImageFormat::PNG: return "png";
        default: return "unknown";
    }
}

ImageFormat ParseImageFormat(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "jpg" || lower == "jpeg") return ImageFormat::JPEG;
    if (lower == "png") return ImageFormat::PNG;

    throw InvalidArgumentException("Unknown image format: " + name);
}

std::optional<ImageFormat> DetectFormat(const EncodedImage& bytes) {
    if (bytes.size() >= sizeof(PNG_MAGIC) &&
        std::memcmp(bytes.data(), PNG_MAGIC, sizeof(PNG_MAGIC)) == 0) {
        return ImageFormat::PNG;
    }
    if (bytes.size() >= sizeof(JPEG_MAGIC) &&
        std::memcmp(bytes.data(), JPEG_MAGIC, sizeof(JPEG_MAGIC)) == 0) {
        return ImageFormat::JPEG;
    }
    return std::nullopt;
}

// =============================================================================
// Memory Codec
// =============================================================================

PixelBuffer DecodeImage(const EncodedImage& bytes) {
    if (bytes.empty()) {
        throw DecodeException("empty input");
    }
    if (!DetectFormat(bytes)) {
        throw DecodeException("not a JPEG or PNG stream");
    }
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw DecodeException("input too large");
    }

    int w = 0, h = 0, channels = 0;
    uint8_t* data = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                          &w, &h, &channels, 4);
    if (!data) {
        const char* reason = stbi_failure_reason();
        throw DecodeException(reason ? reason : "unknown failure");
    }

    PixelBuffer image;
    try {
        image = PixelBuffer::FromData(data, w, h, 4);
    } catch (const std::exception& e) {
        stbi_image_free(data);
        throw DecodeException(e.what());
    }

    stbi_image_free(data);
    return image;
}

bool TryDecodeImage(const EncodedImage& bytes, PixelBuffer& output, std::string* error) {
    try {
        output = DecodeImage(bytes);
        return true;
    } catch (const DecodeException& e) {
        Platform::LogDebug(TAG, std::string("decode failed (") + std::to_string(bytes.size()) +
                           " bytes): " + e.what());
        if (error) {
            *error = e.what();
        }
        return false;
    }
}

EncodedImage EncodeImage(const PixelBuffer& image, ImageFormat format, int32_t quality) {
    Validate::RequireImageNonEmpty(image, "EncodeImage");

    EncodedImage out;
    int ok = 0;

    switch (format) {
        case ImageFormat::JPEG: {
            Validate::RequireRange(quality, 1, 100, "quality", "EncodeImage");
            std::vector<uint8_t> rgb = image.ToRgbBytes();
            ok = stbi_write_jpg_to_func(AppendBytes, &out, image.Width(), image.Height(),
                                        3, rgb.data(), quality);
            break;
        }
        case ImageFormat::PNG: {
            std::vector<uint8_t> rgba = image.ToRgbaBytes();
            ok = stbi_write_png_to_func(AppendBytes, &out, image.Width(), image.Height(),
                                        4, rgba.data(), image.Width() * 4);
            break;
        }
        default:
            throw UnsupportedException("EncodeImage: unknown format");
    }

    if (!ok || out.empty()) {
        Platform::LogWarning(TAG, std::string("stb failed to encode ") +
                             std::to_string(image.Width()) + "x" +
                             std::to_string(image.Height()) + " " + GetImageFormatName(format));
        throw IOException(std::string("Failed to encode ") + GetImageFormatName(format));
    }
    return out;
}

// =============================================================================
// File Helpers
// =============================================================================

EncodedImage ReadFileBytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOException("Failed to open file: " + path);
    }
    EncodedImage bytes((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IOException("Failed to read file: " + path);
    }
    return bytes;
}

void WriteFileBytes(const std::string& path, const EncodedImage& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IOException("Failed to create file: " + path);
    }
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw IOException("Failed to write file: " + path);
    }
}

PixelBuffer ReadImage(const std::string& path) {
    return DecodeImage(ReadFileBytes(path));
}

void WriteImage(const std::string& path, const PixelBuffer& image,
                ImageFormat format, int32_t quality) {
    WriteFileBytes(path, EncodeImage(image, format, quality));
}

} // namespace Pix::Kit::IO
