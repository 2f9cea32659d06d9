#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for PixKit
 */

#include <cstdint>
#include <PixKit/Core/Export.h>
#include <algorithm>
#include <cmath>
#include <vector>

namespace Pix::Kit {

// =============================================================================
// Pixel / Byte Types
// =============================================================================

/**
 * @brief One RGBA sample, 8 bits per channel
 */
struct PIXKIT_API Rgba8 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    Rgba8() = default;
    Rgba8(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255)
        : r(r_), g(g_), b(b_), a(a_) {}

    bool operator==(const Rgba8& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Rgba8& other) const { return !(*this == other); }
};

/// Opaque encoded image bytes (JPEG/PNG)
using EncodedImage = std::vector<uint8_t>;

// =============================================================================
// 2D Point Types
// =============================================================================

/**
 * @brief 2D point with integer coordinates
 */
struct PIXKIT_API Point2i {
    int32_t x = 0;
    int32_t y = 0;

    Point2i() = default;
    Point2i(int32_t x_, int32_t y_) : x(x_), y(y_) {}
};

/**
 * @brief 2D point with sub-pixel precision
 */
struct PIXKIT_API Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }

    Point2d operator+(const Point2d& other) const {
        return {x + other.x, y + other.y};
    }

    Point2d operator-(const Point2d& other) const {
        return {x - other.x, y - other.y};
    }

    double Norm() const {
        return std::sqrt(x * x + y * y);
    }
};

// =============================================================================
// Size / Rectangle Types
// =============================================================================

/**
 * @brief 2D size with integer dimensions
 */
struct PIXKIT_API Size2i {
    int32_t width = 0;
    int32_t height = 0;

    Size2i() = default;
    Size2i(int32_t w, int32_t h) : width(w), height(h) {}

    int64_t Area() const { return static_cast<int64_t>(width) * height; }
    bool IsValid() const { return width >= 0 && height >= 0; }

    bool operator==(const Size2i& other) const {
        return width == other.width && height == other.height;
    }
};

/**
 * @brief Axis-aligned rectangle with integer coordinates
 */
struct PIXKIT_API Rect2i {
    int32_t x = 0;      ///< Left
    int32_t y = 0;      ///< Top
    int32_t width = 0;
    int32_t height = 0;

    Rect2i() = default;
    Rect2i(int32_t x_, int32_t y_, int32_t w, int32_t h)
        : x(x_), y(y_), width(w), height(h) {}

    /// Exclusive right/bottom edge, 64-bit so x + width cannot overflow
    int64_t Right() const { return static_cast<int64_t>(x) + width; }
    int64_t Bottom() const { return static_cast<int64_t>(y) + height; }
    int64_t Area() const { return static_cast<int64_t>(width) * height; }
    bool IsValid() const { return width >= 0 && height >= 0; }

    bool Contains(int32_t px, int32_t py) const {
        return px >= x && px < Right() && py >= y && py < Bottom();
    }

    /// Intersection with another rectangle (empty rect if disjoint)
    Rect2i Intersect(const Rect2i& other) const {
        int32_t left = std::max(x, other.x);
        int32_t top = std::max(y, other.y);
        int64_t right = std::min(Right(), other.Right());
        int64_t bottom = std::min(Bottom(), other.Bottom());
        if (right <= left || bottom <= top) {
            return Rect2i();
        }
        return Rect2i(left, top, static_cast<int32_t>(right - left),
                      static_cast<int32_t>(bottom - top));
    }
};

/**
 * @brief Axis-aligned rectangle with double precision
 */
struct PIXKIT_API Rect2d {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    Rect2d() = default;
    Rect2d(double x_, double y_, double w, double h)
        : x(x_), y(y_), width(w), height(h) {}

    double Area() const { return width * height; }
    Point2d Center() const { return {x + width / 2.0, y + height / 2.0}; }
    bool IsValid() const {
        return std::isfinite(x) && std::isfinite(y) &&
               std::isfinite(width) && std::isfinite(height) &&
               width >= 0.0 && height >= 0.0;
    }
};

} // namespace Pix::Kit
