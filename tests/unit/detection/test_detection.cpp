/**
 * @file test_detection.cpp
 * @brief Unit tests for Detection/DetectedObject.h and Detection/ObjectDetector.h
 */

#include <PixKit/Detection/DetectedObject.h>
#include <PixKit/Detection/ObjectDetector.h>
#include <PixKit/Platform/Log.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace Pix::Kit;
using namespace Pix::Kit::Detection;

namespace {

// Scripted detector recording its lifecycle
class FakeDetector : public ObjectDetector {
public:
    FakeDetector(DetectionKind kind, std::vector<DetectedObject> results,
                 int* closeCount, bool throwOnDetect = false, bool throwOnClose = false)
        : kind_(kind), results_(std::move(results)), closeCount_(closeCount),
          throwOnDetect_(throwOnDetect), throwOnClose_(throwOnClose) {}

    DetectionKind Kind() const override { return kind_; }

    std::vector<DetectedObject> Detect(const EncodedImage&) override {
        if (throwOnDetect_) {
            throw std::runtime_error("model not loaded");
        }
        return results_;
    }

    void Close() override {
        ++*closeCount_;
        if (throwOnClose_) {
            throw std::runtime_error("close failed");
        }
    }

private:
    DetectionKind kind_;
    std::vector<DetectedObject> results_;
    int* closeCount_;
    bool throwOnDetect_;
    bool throwOnClose_;
};

// Native-bridge style detector that throws a plain error code
class ErrorCodeDetector : public ObjectDetector {
public:
    explicit ErrorCodeDetector(int* closeCount) : closeCount_(closeCount) {}

    DetectionKind Kind() const override { return DetectionKind::Object; }

    std::vector<DetectedObject> Detect(const EncodedImage&) override {
        throw 7;
    }

    void Close() override {
        ++*closeCount_;
        throw 9;
    }

private:
    int* closeCount_;
};

} // anonymous namespace

class DetectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        savedLevel_ = Platform::GetLogLevel();
        Platform::SetLogLevel(Platform::LogLevel::Warning);
        Platform::SetLogSink([this](Platform::LogLevel level, const std::string&,
                                    const std::string&) {
            if (level == Platform::LogLevel::Warning) {
                ++warnings_;
            }
        });
    }

    void TearDown() override {
        Platform::SetLogSink(nullptr);
        Platform::SetLogLevel(savedLevel_);
    }

    Platform::LogLevel savedLevel_ = Platform::LogLevel::Warning;

    DetectorHandle MakeHandle(DetectionKind kind, std::vector<DetectedObject> results,
                              bool throwOnDetect = false, bool throwOnClose = false) {
        return DetectorHandle(std::make_unique<FakeDetector>(
            kind, std::move(results), &closeCount_, throwOnDetect, throwOnClose));
    }

    int closeCount_ = 0;
    int warnings_ = 0;
    const EncodedImage bytes_{0xFF, 0xD8, 0xFF};
};

// ============================================================================
// DetectedObject
// ============================================================================

TEST_F(DetectionTest, KindFollowsDetails) {
    DetectedObject obj;
    EXPECT_EQ(obj.Kind(), DetectionKind::Unknown);
    obj.details = FaceDetails{};
    EXPECT_EQ(obj.Kind(), DetectionKind::Face);
    obj.details = TextDetails{};
    EXPECT_EQ(obj.Kind(), DetectionKind::Text);
    EXPECT_STREQ(GetDetectionKindName(DetectionKind::Pose), "pose");
}

TEST_F(DetectionTest, ObjectUsesBestLabel) {
    ObjectDetails details;
    details.trackingId = 7;
    details.labels = {{"Dog", 0.91}, {"Wolf", 0.4}};
    DetectedObject obj = MakeObjectDetection(Rect2d(1, 2, 3, 4), details);
    EXPECT_EQ(obj.label, "Dog");
    EXPECT_DOUBLE_EQ(obj.confidence, 0.91);
    EXPECT_EQ(obj.Kind(), DetectionKind::Object);
    EXPECT_EQ(std::get<ObjectDetails>(obj.details).trackingId, 7);
}

TEST_F(DetectionTest, UnlabelledObject) {
    DetectedObject obj = MakeObjectDetection(Rect2d(0, 0, 1, 1), ObjectDetails{});
    EXPECT_EQ(obj.label, "Object");
    EXPECT_DOUBLE_EQ(obj.confidence, 0.0);
}

TEST_F(DetectionTest, FaceConfidenceDependsOnHeadPose) {
    FaceDetails withPose;
    withPose.headEulerAngleY = 12.0;
    EXPECT_DOUBLE_EQ(MakeFaceDetection(Rect2d(), withPose).confidence, 1.0);
    EXPECT_DOUBLE_EQ(MakeFaceDetection(Rect2d(), FaceDetails{}).confidence, 0.8);
}

TEST_F(DetectionTest, PoseBoundingBoxDefaults) {
    Rect2d box = PoseBoundingBox({});
    EXPECT_DOUBLE_EQ(box.x, 0.0);
    EXPECT_DOUBLE_EQ(box.width, 100.0);
    EXPECT_DOUBLE_EQ(box.height, 200.0);
}

TEST_F(DetectionTest, PoseBoundingBoxSpansLandmarks) {
    std::vector<PoseLandmark> landmarks = {
        {"nose", 40.0, 10.0, 0.9}, {"leftAnkle", 30.0, 300.0, 0.8}, {"rightWrist", 200.0, 150.0, 0.7}};
    Rect2d box = PoseBoundingBox(landmarks);
    EXPECT_DOUBLE_EQ(box.x, 30.0);
    EXPECT_DOUBLE_EQ(box.y, 10.0);
    EXPECT_DOUBLE_EQ(box.width, 170.0);
    EXPECT_DOUBLE_EQ(box.height, 290.0);
}

TEST_F(DetectionTest, PoseBoundingBoxMinimumSize) {
    Rect2d box = PoseBoundingBox({{"nose", 5.0, 6.0, 1.0}});
    EXPECT_DOUBLE_EQ(box.width, 50.0);
    EXPECT_DOUBLE_EQ(box.height, 100.0);

    DetectedObject person = MakePoseDetection(PoseDetails{{{"nose", 5.0, 6.0, 1.0}}});
    EXPECT_EQ(person.label, "Person");
    EXPECT_DOUBLE_EQ(person.confidence, 0.9);
    EXPECT_DOUBLE_EQ(person.boundingBox.x, 5.0);
}

// ============================================================================
// DetectorHandle
// ============================================================================

TEST_F(DetectionTest, HandleClosesOnDestruction) {
    {
        DetectorHandle handle = MakeHandle(DetectionKind::Face, {});
        EXPECT_TRUE(handle.Valid());
    }
    EXPECT_EQ(closeCount_, 1);
}

TEST_F(DetectionTest, HandleClosesOnceAfterMove) {
    {
        DetectorHandle a = MakeHandle(DetectionKind::Face, {});
        DetectorHandle b = std::move(a);
        EXPECT_FALSE(a.Valid());
        b.Reset();
        EXPECT_FALSE(b.Valid());
    }
    EXPECT_EQ(closeCount_, 1);
}

TEST_F(DetectionTest, MoveAssignClosesPrevious) {
    DetectorHandle a = MakeHandle(DetectionKind::Face, {});
    a = MakeHandle(DetectionKind::Text, {});
    EXPECT_EQ(closeCount_, 1);
    EXPECT_EQ(a->Kind(), DetectionKind::Text);
}

TEST_F(DetectionTest, CloseFailureIsLoggedNotThrown) {
    DetectorHandle handle = MakeHandle(DetectionKind::Pose, {}, false, true);
    EXPECT_NO_THROW(handle.Reset());
    EXPECT_EQ(closeCount_, 1);
    EXPECT_EQ(warnings_, 1);
}

TEST_F(DetectionTest, ErrorCodeOnCloseIsLogged) {
    {
        DetectorHandle handle(std::make_unique<ErrorCodeDetector>(&closeCount_));
        DetectorHandle other = MakeHandle(DetectionKind::Face, {});
        other = std::move(handle);   // closes the face detector
        EXPECT_EQ(closeCount_, 1);
    }                                // destructor closes the error-code detector
    EXPECT_EQ(closeCount_, 2);
    EXPECT_EQ(warnings_, 1);
}

// ============================================================================
// DetectObjects
// ============================================================================

TEST_F(DetectionTest, AggregatesInDetectorOrder) {
    std::vector<DetectorHandle> detectors;
    detectors.push_back(MakeHandle(DetectionKind::Face,
                                   {MakeFaceDetection(Rect2d(0, 0, 5, 5), FaceDetails{})}));
    detectors.emplace_back();
    detectors.push_back(MakeHandle(DetectionKind::Text,
                                   {MakeTextDetection(Rect2d(), TextDetails{"a", {"a"}}),
                                    MakeTextDetection(Rect2d(), TextDetails{"b", {"b"}})}));

    std::vector<DetectedObject> found = DetectObjects(detectors, bytes_);
    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0].Kind(), DetectionKind::Face);
    EXPECT_EQ(std::get<TextDetails>(found[2].details).text, "b");
}

TEST_F(DetectionTest, FailureYieldsEmptyResult) {
    std::vector<DetectorHandle> detectors;
    detectors.push_back(MakeHandle(DetectionKind::Face,
                                   {MakeFaceDetection(Rect2d(0, 0, 5, 5), FaceDetails{})}));
    detectors.push_back(MakeHandle(DetectionKind::Object, {}, true));

    EXPECT_TRUE(DetectObjects(detectors, bytes_).empty());
    EXPECT_EQ(warnings_, 1);
}

TEST_F(DetectionTest, ErrorCodeFailureYieldsEmptyResult) {
    std::vector<DetectorHandle> detectors;
    detectors.push_back(MakeHandle(DetectionKind::Face,
                                   {MakeFaceDetection(Rect2d(0, 0, 5, 5), FaceDetails{})}));
    detectors.emplace_back(std::make_unique<ErrorCodeDetector>(&closeCount_));

    std::vector<DetectedObject> found;
    EXPECT_NO_THROW(found = DetectObjects(detectors, bytes_));
    EXPECT_TRUE(found.empty());
    EXPECT_EQ(warnings_, 1);
    detectors.clear();
    EXPECT_EQ(closeCount_, 2);
}

TEST_F(DetectionTest, NoDetectors) {
    EXPECT_TRUE(DetectObjects({}, bytes_).empty());
}
