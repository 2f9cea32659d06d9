#pragma once

/**
 * @file Accelerator.h
 * @brief External accelerator interface (tried before the built-in kernels)
 *
 * An accelerator receives the operation name, a parameter map and the
 * encoded input, and either returns processed bytes or declines. Declining,
 * throwing, or running past the time budget all lead to the built-in kernel.
 */

#include <PixKit/Core/Export.h>
#include <PixKit/Core/Types.h>
#include <PixKit/Detection/DetectedObject.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Pix::Kit::Accel {

// =============================================================================
// Parameters
// =============================================================================

/// One named parameter of an accelerator call
using ParamValue = std::variant<bool, int64_t, double, std::string, EncodedImage,
                                std::vector<Detection::DetectedObject>>;

/// Named parameters, keys such as "sigma", "width", "watermark"
using ParamMap = std::map<std::string, ParamValue>;

/// Default wait on one accelerator call
constexpr std::chrono::milliseconds DEFAULT_ACCELERATOR_BUDGET{2000};

// =============================================================================
// Status
// =============================================================================

/**
 * @brief Outcome of one accelerator attempt
 */
enum class AcceleratorStatus {
    Handled,        ///< Result produced, used as-is
    Unavailable,    ///< No accelerator, or it reports not available
    Unsupported,    ///< Accelerator does not implement the operation
    NotHandled,     ///< Accelerator returned no (or an empty) result
    Failed,         ///< Accelerator threw
    TimedOut        ///< Budget exceeded
};

PIXKIT_API const char* GetAcceleratorStatusName(AcceleratorStatus status);

// =============================================================================
// Accelerator
// =============================================================================

/**
 * @brief Platform-native or hardware-backed implementation of the filters
 *
 * Invoke() may be called from a worker thread and must be thread-safe.
 */
class PIXKIT_API Accelerator {
public:
    virtual ~Accelerator() = default;

    /// Whether the backend can run at all right now
    virtual bool IsAvailable() const = 0;

    /// Whether the named operation is implemented
    virtual bool Supports(const std::string& operation) const {
        (void)operation;
        return true;
    }

    /**
     * @brief Run the named operation
     * @return Processed encoded bytes, or std::nullopt to decline
     */
    virtual std::optional<EncodedImage> Invoke(const std::string& operation,
                                               const ParamMap& params,
                                               const EncodedImage& image) = 0;
};

} // namespace Pix::Kit::Accel
