#pragma once

/**
 * @file PixelBuffer.h
 * @brief Decoded RGBA raster used by every kernel
 */

#include <PixKit/Core/Export.h>
#include <PixKit/Core/Types.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Pix::Kit {

/**
 * @brief In-memory RGBA8 image
 *
 * Key features:
 * - Row-major storage, origin top-left, no row padding
 * - Invariant: pixel count == width * height
 * - Value semantics: copy is deep, move transfers ownership
 */
class PIXKIT_API PixelBuffer {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty buffer)
    PixelBuffer() = default;

    /// Create buffer with specified dimensions, filled with transparent black
    PixelBuffer(int32_t width, int32_t height);

    /// Create buffer with specified dimensions, filled with a color
    PixelBuffer(int32_t width, int32_t height, const Rgba8& fill);

    PixelBuffer(const PixelBuffer& other) = default;
    PixelBuffer(PixelBuffer&& other) noexcept;
    PixelBuffer& operator=(const PixelBuffer& other) = default;
    PixelBuffer& operator=(PixelBuffer&& other) noexcept;
    ~PixelBuffer() = default;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /**
     * @brief Create from interleaved 8-bit samples (copies data)
     * @param data Source samples, width * height * channels bytes
     * @param channels 1 (gray), 2 (gray+alpha), 3 (RGB) or 4 (RGBA)
     *
     * Missing alpha is filled with 255, gray is replicated to R, G and B.
     */
    static PixelBuffer FromData(const uint8_t* data, int32_t width, int32_t height,
                                int channels = 4);

    // =========================================================================
    // Basic Properties
    // =========================================================================

    int32_t Width() const { return width_; }
    int32_t Height() const { return height_; }
    Size2i Size() const { return {width_, height_}; }

    /// Number of pixels (width * height)
    size_t PixelCount() const { return pixels_.size(); }

    /// Check if buffer is empty
    bool Empty() const { return width_ == 0 || height_ == 0; }

    /// Check the size invariant holds and buffer is non-empty
    bool IsValid() const;

    // =========================================================================
    // Data Access
    // =========================================================================

    Rgba8* Data() { return pixels_.data(); }
    const Rgba8* Data() const { return pixels_.data(); }

    Rgba8* RowPtr(int32_t row) { return pixels_.data() + static_cast<size_t>(row) * width_; }
    const Rgba8* RowPtr(int32_t row) const {
        return pixels_.data() + static_cast<size_t>(row) * width_;
    }

    /// Get pixel at (x, y), no bounds check
    const Rgba8& At(int32_t x, int32_t y) const { return RowPtr(y)[x]; }

    /// Set pixel at (x, y), no bounds check
    void SetAt(int32_t x, int32_t y, const Rgba8& value) { RowPtr(y)[x] = value; }

    /// Check (x, y) lies inside the buffer
    bool Contains(int32_t x, int32_t y) const {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }

    /// Fill all pixels with a color
    void Fill(const Rgba8& color);

    /// Interleaved RGBA bytes (width * height * 4)
    std::vector<uint8_t> ToRgbaBytes() const;

    /// Interleaved RGB bytes, alpha dropped (width * height * 3)
    std::vector<uint8_t> ToRgbBytes() const;

    bool operator==(const PixelBuffer& other) const;
    bool operator!=(const PixelBuffer& other) const { return !(*this == other); }

private:
    int32_t width_ = 0;
    int32_t height_ = 0;
    std::vector<Rgba8> pixels_;
};

} // namespace Pix::Kit
