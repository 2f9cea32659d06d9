#pragma once

/**
 * @file ObjectDetector.h
 * @brief Detector collaborator interface and scoped ownership
 *
 * Detectors are supplied by the caller (ML backends live outside the
 * library). A DetectorHandle owns one and closes it on destruction.
 *
 * @code
 * std::vector<DetectorHandle> detectors;
 * detectors.emplace_back(std::make_unique<MyFaceDetector>());
 * auto found = DetectObjects(detectors, jpegBytes);
 * @endcode
 */

#include <PixKit/Core/Export.h>
#include <PixKit/Core/Types.h>
#include <PixKit/Detection/DetectedObject.h>

#include <memory>
#include <vector>

namespace Pix::Kit::Detection {

/**
 * @brief External detector
 */
class PIXKIT_API ObjectDetector {
public:
    virtual ~ObjectDetector() = default;

    virtual DetectionKind Kind() const = 0;

    /**
     * @brief Run detection on encoded image bytes
     * @throws any std::exception on backend failure
     */
    virtual std::vector<DetectedObject> Detect(const EncodedImage& image) = 0;

    /// Release backend resources; called once by DetectorHandle
    virtual void Close() = 0;
};

/**
 * @brief Move-only owner of a detector, closes it on destruction
 */
class PIXKIT_API DetectorHandle {
public:
    DetectorHandle() = default;
    explicit DetectorHandle(std::unique_ptr<ObjectDetector> detector);
    ~DetectorHandle();

    DetectorHandle(DetectorHandle&& other) noexcept = default;
    DetectorHandle& operator=(DetectorHandle&& other) noexcept;

    DetectorHandle(const DetectorHandle&) = delete;
    DetectorHandle& operator=(const DetectorHandle&) = delete;

    bool Valid() const { return detector_ != nullptr; }
    explicit operator bool() const { return Valid(); }

    ObjectDetector* Get() const { return detector_.get(); }
    ObjectDetector* operator->() const { return detector_.get(); }

    /**
     * @brief Close and release the detector now
     *
     * Close failures are logged, never thrown.
     */
    void Reset();

private:
    std::unique_ptr<ObjectDetector> detector_;
};

/**
 * @brief Run every detector and concatenate the results
 *
 * Any detector failure logs a warning and yields an empty list. Invalid
 * (empty) handles are skipped.
 */
PIXKIT_API std::vector<DetectedObject> DetectObjects(const std::vector<DetectorHandle>& detectors,
                                                     const EncodedImage& image);

} // namespace Pix::Kit::Detection
