/**
 * @file DetectedObject.cpp
 * @brief Detection kinds and construction helpers
 */

#include <PixKit/Detection/DetectedObject.h>

#include <algorithm>
#include <limits>

namespace Pix::Kit::Detection {

namespace {

constexpr double POSE_MIN_WIDTH = 50.0;
constexpr double POSE_MIN_HEIGHT = 100.0;
constexpr double POSE_DEFAULT_WIDTH = 100.0;
constexpr double POSE_DEFAULT_HEIGHT = 200.0;

constexpr double FACE_CONFIDENCE_WITH_POSE = 1.0;
constexpr double FACE_CONFIDENCE = 0.8;
constexpr double POSE_CONFIDENCE = 0.9;
constexpr double TEXT_CONFIDENCE = 0.9;

} // anonymous namespace

DetectionKind DetectedObject::Kind() const {
    switch (details.index()) {
        case 1: return DetectionKind::Object;
        case 2: return DetectionKind::Face;
        case 3: return DetectionKind::Pose;
        case 4: return DetectionKind::Text;
        default: return DetectionKind::Unknown;
    }
}

const char* GetDetectionKindName(DetectionKind kind) {
    switch (kind) {
        case DetectionKind::Object: return "object";
        case DetectionKind::Face: return "face";
        case DetectionKind::Pose: return "pose";
        case DetectionKind::Text: return "text";
        default: return "unknown";
    }
}

Rect2d PoseBoundingBox(const std::vector<PoseLandmark>& landmarks) {
    if (landmarks.empty()) {
        return Rect2d(0.0, 0.0, POSE_DEFAULT_WIDTH, POSE_DEFAULT_HEIGHT);
    }

    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();

    for (const auto& lm : landmarks) {
        minX = std::min(minX, lm.x);
        minY = std::min(minY, lm.y);
        maxX = std::max(maxX, lm.x);
        maxY = std::max(maxY, lm.y);
    }

    return Rect2d(minX, minY,
                  std::max(maxX - minX, POSE_MIN_WIDTH),
                  std::max(maxY - minY, POSE_MIN_HEIGHT));
}

DetectedObject MakeObjectDetection(const Rect2d& box, ObjectDetails details) {
    DetectedObject obj;
    if (details.labels.empty()) {
        obj.label = "Object";
    } else {
        obj.label = details.labels.front().text;
        obj.confidence = details.labels.front().confidence;
    }
    obj.boundingBox = box;
    obj.details = std::move(details);
    return obj;
}

DetectedObject MakeFaceDetection(const Rect2d& box, FaceDetails details) {
    DetectedObject obj;
    obj.label = "Face";
    obj.confidence = details.headEulerAngleY ? FACE_CONFIDENCE_WITH_POSE : FACE_CONFIDENCE;
    obj.boundingBox = box;
    obj.details = std::move(details);
    return obj;
}

DetectedObject MakePoseDetection(PoseDetails details) {
    DetectedObject obj;
    obj.label = "Person";
    obj.confidence = POSE_CONFIDENCE;
    obj.boundingBox = PoseBoundingBox(details.landmarks);
    obj.details = std::move(details);
    return obj;
}

DetectedObject MakeTextDetection(const Rect2d& box, TextDetails details) {
    DetectedObject obj;
    obj.label = "Text";
    obj.confidence = TEXT_CONFIDENCE;
    obj.boundingBox = box;
    obj.details = std::move(details);
    return obj;
}

} // namespace Pix::Kit::Detection
