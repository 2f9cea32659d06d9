#pragma once

/**
 * @file FallbackController.h
 * @brief "Try the accelerator, else run the built-in kernel" for every filter
 *
 * Per call: TryAccelerator -> Done (Handled), or
 *           TryAccelerator -> Fallback (every other status).
 * The fallback is never reported as an error.
 */

#include <PixKit/Accel/Accelerator.h>
#include <PixKit/Core/Export.h>
#include <PixKit/Core/Types.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace Pix::Kit::Accel {

/// Budgeted attempts that may still be running before new calls skip the accelerator
constexpr size_t MAX_PENDING_ACCELERATOR_CALLS = 4;

/**
 * @brief Result of one controlled call
 */
struct PIXKIT_API FallbackResult {
    EncodedImage bytes;
    AcceleratorStatus status = AcceleratorStatus::Unavailable;

    bool Accelerated() const { return status == AcceleratorStatus::Handled; }
};

/**
 * @brief Accelerator attempt with bounded wait, then local fallback
 *
 * Budgeted calls run on a detached thread that shares ownership of the
 * accelerator, so a hung backend never blocks the caller past the budget.
 * At most MAX_PENDING_ACCELERATOR_CALLS such threads exist per controller;
 * once that many are still running (timed out on a hung backend), further
 * calls report Unavailable without starting a thread.
 * A zero budget runs the call inline without a timeout.
 */
class PIXKIT_API FallbackController {
public:
    using LocalStrategy = std::function<EncodedImage()>;

    /**
     * @param accelerator Backend to try first (nullptr = always fall back)
     * @param budget Maximum wait per call (0 = inline, no timeout)
     */
    explicit FallbackController(std::shared_ptr<Accelerator> accelerator = nullptr,
                                std::chrono::milliseconds budget = DEFAULT_ACCELERATOR_BUDGET);

    bool HasAccelerator() const { return accelerator_ != nullptr; }
    std::chrono::milliseconds Budget() const { return budget_; }

    /// Budgeted accelerator calls whose worker thread has not finished yet
    size_t PendingAttempts() const { return pending_->load(); }

    /**
     * @brief Attempt the accelerator only
     * @param[out] result Accelerator output, set only when Handled
     */
    AcceleratorStatus TryAccelerator(const std::string& operation, const ParamMap& params,
                                     const EncodedImage& image, EncodedImage& result) const;

    /**
     * @brief Accelerator first, local strategy on any non-Handled status
     *
     * Exceptions from the local strategy propagate unchanged.
     */
    FallbackResult Run(const std::string& operation, const ParamMap& params,
                       const EncodedImage& image, const LocalStrategy& fallback) const;

private:
    std::shared_ptr<Accelerator> accelerator_;
    std::chrono::milliseconds budget_;
    // Shared with the workers, which may outlive the controller
    std::shared_ptr<std::atomic<size_t>> pending_;
};

} // namespace Pix::Kit::Accel
