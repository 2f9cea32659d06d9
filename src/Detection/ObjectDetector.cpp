/**
 * @file ObjectDetector.cpp
 * @brief Detector ownership and aggregation
 */

#include <PixKit/Detection/ObjectDetector.h>
#include <PixKit/Platform/Log.h>

#include <exception>
#include <iterator>
#include <string>

namespace Pix::Kit::Detection {

namespace {
const char* TAG = "Detection";
} // anonymous namespace

// =============================================================================
// DetectorHandle
// =============================================================================

DetectorHandle::DetectorHandle(std::unique_ptr<ObjectDetector> detector)
    : detector_(std::move(detector)) {}

DetectorHandle::~DetectorHandle() {
    Reset();
}

DetectorHandle& DetectorHandle::operator=(DetectorHandle&& other) noexcept {
    if (this != &other) {
        Reset();
        detector_ = std::move(other.detector_);
    }
    return *this;
}

void DetectorHandle::Reset() {
    if (!detector_) {
        return;
    }
    try {
        detector_->Close();
    } catch (const std::exception& e) {
        Platform::LogWarning(TAG, std::string("failed to close ") +
                             GetDetectionKindName(detector_->Kind()) +
                             " detector: " + e.what());
    } catch (...) {
        // Runs from the destructor and the noexcept move assignment
        Platform::LogWarning(TAG, std::string("failed to close ") +
                             GetDetectionKindName(detector_->Kind()) +
                             " detector: non-standard exception");
    }
    detector_.reset();
}

// =============================================================================
// Aggregation
// =============================================================================

std::vector<DetectedObject> DetectObjects(const std::vector<DetectorHandle>& detectors,
                                          const EncodedImage& image) {
    std::vector<DetectedObject> detections;
    try {
        for (const auto& handle : detectors) {
            if (!handle) {
                continue;
            }
            std::vector<DetectedObject> found = handle->Detect(image);
            detections.insert(detections.end(),
                              std::make_move_iterator(found.begin()),
                              std::make_move_iterator(found.end()));
        }
    } catch (const std::exception& e) {
        Platform::LogWarning(TAG, std::string("failed to detect objects: ") + e.what());
        return {};
    } catch (...) {
        Platform::LogWarning(TAG, "failed to detect objects: non-standard exception");
        return {};
    }

    Platform::LogInfo(TAG, "detected " + std::to_string(detections.size()) + " objects");
    return detections;
}

} // namespace Pix::Kit::Detection
