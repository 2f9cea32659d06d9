#pragma once

/**
 * @file Validate.h
 * @brief Unified validation utilities for PixKit
 *
 * Design principles:
 * - Empty image returns false (not an error), invalid throws
 * - Parameter checks throw InvalidArgumentException, never clamp
 * - Consistent error message format: "<Func>: <param> must be ..., got ..."
 */

#include <PixKit/Core/Export.h>
#include <PixKit/Core/Exception.h>
#include <PixKit/Core/PixelBuffer.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace Pix::Kit::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(float val) {
    return FormatValue(static_cast<double>(val));
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatValue(int64_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

} // namespace Detail

// =============================================================================
// Image Validation
// =============================================================================

/**
 * @brief Check buffer is allocated and consistent
 *
 * Use this when empty image should be a silent no-op (e.g., filtering).
 *
 * @return false if empty (caller should return empty result)
 * @throws InvalidArgumentException if the size invariant is broken
 */
inline bool RequireImageValid(const PixelBuffer& image, const char* funcName) {
    if (image.Empty()) {
        return false;  // Empty = no-op, not an error
    }
    if (!image.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is invalid");
    }
    return true;
}

/**
 * @brief Check buffer is non-empty and valid (throws on empty)
 */
inline void RequireImageNonEmpty(const PixelBuffer& image, const char* funcName) {
    if (image.Empty()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is empty");
    }
    if (!image.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is invalid");
    }
}

// =============================================================================
// Parameter Validation
// =============================================================================

/**
 * @brief Validate floating-point value is finite
 */
inline void RequireFinite(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite");
    }
}

/**
 * @brief Validate value is in range [min, max]
 */
template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (!(value >= minVal && value <= maxVal)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is positive (> 0)
 */
template<typename T>
inline void RequirePositive(T value, const char* paramName, const char* funcName) {
    if (!(value > T(0))) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be > 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is non-negative (>= 0)
 */
template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (!(value >= T(0))) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is at least minimum (>= min)
 */
template<typename T>
inline void RequireMin(T value, T minVal, const char* paramName, const char* funcName) {
    if (!(value >= minVal)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= " +
            Detail::FormatValue(minVal) + ", got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate thread count (>= 1)
 */
inline void RequireThreadCount(int numThread, const char* funcName) {
    if (numThread < 1) {
        throw InvalidArgumentException(
            std::string(funcName) + ": numThread must be >= 1, got " +
            std::to_string(numThread));
    }
}

} // namespace Pix::Kit::Validate
