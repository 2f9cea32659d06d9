#pragma once

/**
 * @file DetectedObject.h
 * @brief Typed results of external object / face / pose / text detectors
 *
 * Every result shares the label / confidence / boundingBox envelope; the
 * detector-specific data lives in a variant.
 */

#include <PixKit/Core/Export.h>
#include <PixKit/Core/Types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Pix::Kit::Detection {

// =============================================================================
// Detail Types
// =============================================================================

/**
 * @brief Candidate classification of a generic object
 */
struct PIXKIT_API LabelScore {
    std::string text;
    double confidence = 0.0;
};

/**
 * @brief Generic object detector output
 */
struct PIXKIT_API ObjectDetails {
    std::optional<int32_t> trackingId;
    std::vector<LabelScore> labels;     ///< Best candidate first
};

/**
 * @brief Face detector output
 */
struct PIXKIT_API FaceDetails {
    std::optional<double> smilingProbability;
    std::optional<double> leftEyeOpenProbability;
    std::optional<double> rightEyeOpenProbability;
    std::optional<double> headEulerAngleY;      ///< Degrees
    std::optional<double> headEulerAngleZ;      ///< Degrees
    int32_t landmarkCount = 0;

    bool HasLandmarks() const { return landmarkCount > 0; }
};

/**
 * @brief One body landmark of a pose
 */
struct PIXKIT_API PoseLandmark {
    std::string type;               ///< e.g. "leftShoulder"
    double x = 0.0;
    double y = 0.0;
    double inFrameLikelihood = 0.0;
};

/**
 * @brief Pose detector output
 */
struct PIXKIT_API PoseDetails {
    std::vector<PoseLandmark> landmarks;
};

/**
 * @brief Text recognizer output (one block)
 */
struct PIXKIT_API TextDetails {
    std::string text;
    std::vector<std::string> lines;
};

using DetectionDetails = std::variant<std::monostate, ObjectDetails, FaceDetails,
                                      PoseDetails, TextDetails>;

/**
 * @brief Detector family, derived from the details alternative
 */
enum class DetectionKind {
    Unknown,
    Object,
    Face,
    Pose,
    Text
};

// =============================================================================
// DetectedObject
// =============================================================================

/**
 * @brief One detection in pixel coordinates
 *
 * Created per detection call, read-only afterwards.
 */
struct PIXKIT_API DetectedObject {
    std::string label;
    double confidence = 0.0;        ///< [0, 1]
    Rect2d boundingBox;
    DetectionDetails details;

    DetectionKind Kind() const;
};

PIXKIT_API const char* GetDetectionKindName(DetectionKind kind);

// =============================================================================
// Construction Helpers
// =============================================================================

/**
 * @brief Box spanning the pose landmarks
 *
 * Size is at least 50 x 100. No landmarks gives (0, 0, 100, 200).
 */
PIXKIT_API Rect2d PoseBoundingBox(const std::vector<PoseLandmark>& landmarks);

/// Object detection labelled with its best candidate ("Object", 0 if none)
PIXKIT_API DetectedObject MakeObjectDetection(const Rect2d& box, ObjectDetails details);

/// "Face", confidence 1.0 when head pose is known, 0.8 otherwise
PIXKIT_API DetectedObject MakeFaceDetection(const Rect2d& box, FaceDetails details);

/// "Person", confidence 0.9, box from PoseBoundingBox()
PIXKIT_API DetectedObject MakePoseDetection(PoseDetails details);

/// "Text", confidence 0.9
PIXKIT_API DetectedObject MakeTextDetection(const Rect2d& box, TextDetails details);

} // namespace Pix::Kit::Detection
