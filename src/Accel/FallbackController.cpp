/**
 * @file FallbackController.cpp
 * @brief Accelerator attempt and fallback policy
 */

#include <PixKit/Accel/FallbackController.h>
#include <PixKit/Core/Validate.h>
#include <PixKit/Platform/Log.h>

#include <exception>
#include <future>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace Pix::Kit::Accel {

namespace {

const char* TAG = "Fallback";

void LogStatus(AcceleratorStatus status, const std::string& operation,
               const std::string& reason = std::string()) {
    std::string msg = operation + ": accelerator " + GetAcceleratorStatusName(status);
    if (!reason.empty()) {
        msg += " (" + reason + ")";
    }

    switch (status) {
        case AcceleratorStatus::Handled:
            Platform::LogInfo(TAG, msg);
            break;
        case AcceleratorStatus::Unavailable:
        case AcceleratorStatus::Unsupported:
        case AcceleratorStatus::NotHandled:
            Platform::LogDebug(TAG, msg + ", using built-in kernel");
            break;
        case AcceleratorStatus::Failed:
        case AcceleratorStatus::TimedOut:
            Platform::LogWarning(TAG, msg + ", using built-in kernel");
            break;
    }
}

} // anonymous namespace

const char* GetAcceleratorStatusName(AcceleratorStatus status) {
    switch (status) {
        case AcceleratorStatus::Handled: return "handled";
        case AcceleratorStatus::Unavailable: return "unavailable";
        case AcceleratorStatus::Unsupported: return "unsupported";
        case AcceleratorStatus::NotHandled: return "not handled";
        case AcceleratorStatus::Failed: return "failed";
        case AcceleratorStatus::TimedOut: return "timed out";
        default: return "unknown";
    }
}

FallbackController::FallbackController(std::shared_ptr<Accelerator> accelerator,
                                       std::chrono::milliseconds budget)
    : accelerator_(std::move(accelerator))
    , budget_(budget)
    , pending_(std::make_shared<std::atomic<size_t>>(0))
{
    Validate::RequireNonNegative(static_cast<int64_t>(budget.count()), "budget",
                                 "FallbackController");
}

AcceleratorStatus FallbackController::TryAccelerator(const std::string& operation,
                                                     const ParamMap& params,
                                                     const EncodedImage& image,
                                                     EncodedImage& result) const {
    if (!accelerator_) {
        LogStatus(AcceleratorStatus::Unavailable, operation, "none installed");
        return AcceleratorStatus::Unavailable;
    }

    std::optional<EncodedImage> output;
    try {
        if (!accelerator_->IsAvailable()) {
            LogStatus(AcceleratorStatus::Unavailable, operation);
            return AcceleratorStatus::Unavailable;
        }
        if (!accelerator_->Supports(operation)) {
            LogStatus(AcceleratorStatus::Unsupported, operation);
            return AcceleratorStatus::Unsupported;
        }

        if (budget_.count() == 0) {
            output = accelerator_->Invoke(operation, params, image);
        } else {
            if (pending_->fetch_add(1) >= MAX_PENDING_ACCELERATOR_CALLS) {
                pending_->fetch_sub(1);
                Platform::LogWarning(TAG, operation + ": accelerator busy, " +
                                     std::to_string(MAX_PENDING_ACCELERATOR_CALLS) +
                                     " calls still pending, using built-in kernel");
                return AcceleratorStatus::Unavailable;
            }

            // The worker owns copies of everything it touches, it may outlive this call
            std::shared_ptr<Accelerator> accel = accelerator_;
            std::shared_ptr<std::atomic<size_t>> pending = pending_;
            auto task = std::make_shared<std::packaged_task<std::optional<EncodedImage>()>>(
                [accel, operation, params, image]() {
                    return accel->Invoke(operation, params, image);
                });
            std::future<std::optional<EncodedImage>> future = task->get_future();
            try {
                std::thread([task, pending]() {
                    (*task)();
                    pending->fetch_sub(1);
                }).detach();
            } catch (const std::system_error&) {
                pending_->fetch_sub(1);
                throw;
            }

            if (future.wait_for(budget_) != std::future_status::ready) {
                LogStatus(AcceleratorStatus::TimedOut, operation,
                          "budget " + std::to_string(budget_.count()) + " ms");
                return AcceleratorStatus::TimedOut;
            }
            output = future.get();
        }
    } catch (const std::exception& e) {
        LogStatus(AcceleratorStatus::Failed, operation, e.what());
        return AcceleratorStatus::Failed;
    } catch (...) {
        // Native bridges may throw types outside the std::exception tree
        LogStatus(AcceleratorStatus::Failed, operation, "non-standard exception");
        return AcceleratorStatus::Failed;
    }

    if (!output || output->empty()) {
        LogStatus(AcceleratorStatus::NotHandled, operation);
        return AcceleratorStatus::NotHandled;
    }

    result = std::move(*output);
    LogStatus(AcceleratorStatus::Handled, operation);
    return AcceleratorStatus::Handled;
}

FallbackResult FallbackController::Run(const std::string& operation, const ParamMap& params,
                                       const EncodedImage& image,
                                       const LocalStrategy& fallback) const {
    FallbackResult result;
    result.status = TryAccelerator(operation, params, image, result.bytes);
    if (result.status != AcceleratorStatus::Handled) {
        result.bytes = fallback();
    }
    return result;
}

} // namespace Pix::Kit::Accel
