#include <PixKit/Core/PixelBuffer.h>
#include <PixKit/Core/Exception.h>

#include <algorithm>
#include <limits>
#include <string>

namespace Pix::Kit {

// =============================================================================
// Constructors
// =============================================================================

PixelBuffer::PixelBuffer(int32_t width, int32_t height)
    : PixelBuffer(width, height, Rgba8(0, 0, 0, 0)) {}

PixelBuffer::PixelBuffer(int32_t width, int32_t height, const Rgba8& fill) {
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("PixelBuffer dimensions must be positive, got " +
                                       std::to_string(width) + "x" + std::to_string(height));
    }
    if (static_cast<uint64_t>(width) * static_cast<uint64_t>(height) >
        std::numeric_limits<uint32_t>::max()) {
        throw InvalidArgumentException("PixelBuffer dimensions too large");
    }

    width_ = width;
    height_ = height;
    pixels_.assign(static_cast<size_t>(width) * height, fill);
}

PixelBuffer::PixelBuffer(PixelBuffer&& other) noexcept
    : width_(other.width_), height_(other.height_), pixels_(std::move(other.pixels_))
{
    // Moved-from buffer is left empty, keeping the size invariant
    other.width_ = 0;
    other.height_ = 0;
    other.pixels_.clear();
}

PixelBuffer& PixelBuffer::operator=(PixelBuffer&& other) noexcept {
    if (this != &other) {
        width_ = other.width_;
        height_ = other.height_;
        pixels_ = std::move(other.pixels_);
        other.width_ = 0;
        other.height_ = 0;
        other.pixels_.clear();
    }
    return *this;
}

// =============================================================================
// Factory Methods
// =============================================================================

PixelBuffer PixelBuffer::FromData(const uint8_t* data, int32_t width, int32_t height,
                                  int channels) {
    if (data == nullptr) {
        throw InvalidArgumentException("PixelBuffer::FromData: data is null");
    }
    if (channels < 1 || channels > 4) {
        throw UnsupportedException("PixelBuffer::FromData: unsupported channel count " +
                                   std::to_string(channels));
    }

    PixelBuffer buffer(width, height);
    const size_t count = buffer.PixelCount();
    Rgba8* dst = buffer.Data();

    for (size_t i = 0; i < count; ++i) {
        const uint8_t* src = data + i * channels;
        switch (channels) {
            case 1: dst[i] = Rgba8(src[0], src[0], src[0], 255); break;
            case 2: dst[i] = Rgba8(src[0], src[0], src[0], src[1]); break;
            case 3: dst[i] = Rgba8(src[0], src[1], src[2], 255); break;
            default: dst[i] = Rgba8(src[0], src[1], src[2], src[3]); break;
        }
    }

    return buffer;
}

// =============================================================================
// Properties / Access
// =============================================================================

bool PixelBuffer::IsValid() const {
    return !Empty() &&
           pixels_.size() == static_cast<size_t>(width_) * static_cast<size_t>(height_);
}

void PixelBuffer::Fill(const Rgba8& color) {
    std::fill(pixels_.begin(), pixels_.end(), color);
}

std::vector<uint8_t> PixelBuffer::ToRgbaBytes() const {
    std::vector<uint8_t> bytes(pixels_.size() * 4);
    for (size_t i = 0; i < pixels_.size(); ++i) {
        bytes[i * 4 + 0] = pixels_[i].r;
        bytes[i * 4 + 1] = pixels_[i].g;
        bytes[i * 4 + 2] = pixels_[i].b;
        bytes[i * 4 + 3] = pixels_[i].a;
    }
    return bytes;
}

std::vector<uint8_t> PixelBuffer::ToRgbBytes() const {
    std::vector<uint8_t> bytes(pixels_.size() * 3);
    for (size_t i = 0; i < pixels_.size(); ++i) {
        bytes[i * 3 + 0] = pixels_[i].r;
        bytes[i * 3 + 1] = pixels_[i].g;
        bytes[i * 3 + 2] = pixels_[i].b;
    }
    return bytes;
}

bool PixelBuffer::operator==(const PixelBuffer& other) const {
    return width_ == other.width_ && height_ == other.height_ && pixels_ == other.pixels_;
}

} // namespace Pix::Kit
