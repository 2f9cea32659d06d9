#pragma once

#include <PixKit/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for PixKit
 */

#include <stdexcept>
#include <string>

namespace Pix::Kit {

/**
 * @brief Base exception class for PixKit
 */
class PIXKIT_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 *
 * The only failure the byte-level API reports to callers (bad crop rectangle,
 * non-positive resize dimensions, out-of-range factors).
 */
class PIXKIT_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Out of range exception
 */
class PIXKIT_API OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message) {}
};

/**
 * @brief File or stream I/O exception
 */
class PIXKIT_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}

protected:
    struct NoPrefix {};
    IOException(const std::string& message, NoPrefix)
        : Exception(message) {}
};

/**
 * @brief Encoded bytes could not be decoded (corrupt or unsupported format)
 */
class PIXKIT_API DecodeException : public IOException {
public:
    explicit DecodeException(const std::string& message)
        : IOException("Decode error: " + message, NoPrefix{}) {}
};

/**
 * @brief Unsupported operation or format
 */
class PIXKIT_API UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception("Unsupported: " + message) {}
};

} // namespace Pix::Kit
