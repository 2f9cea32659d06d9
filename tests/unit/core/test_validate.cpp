/**
 * @file test_validate.cpp
 * @brief Unit tests for Core/Validate.h
 */

#include <PixKit/Core/Validate.h>
#include <gtest/gtest.h>

#include <limits>
#include <string>

using namespace Pix::Kit;

TEST(ValidateTest, EmptyImageIsNoOp) {
    PixelBuffer empty;
    EXPECT_FALSE(Validate::RequireImageValid(empty, "Test"));
    EXPECT_TRUE(Validate::RequireImageValid(PixelBuffer(1, 1), "Test"));
}

TEST(ValidateTest, NonEmptyRequired) {
    EXPECT_THROW(Validate::RequireImageNonEmpty(PixelBuffer(), "Test"), InvalidArgumentException);
    EXPECT_NO_THROW(Validate::RequireImageNonEmpty(PixelBuffer(2, 2), "Test"));
}

TEST(ValidateTest, RangeRejectsNaN) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(Validate::RequireRange(nan, 0.0, 1.0, "v", "Test"), InvalidArgumentException);
    EXPECT_NO_THROW(Validate::RequireRange(1.0, 0.0, 1.0, "v", "Test"));
    EXPECT_THROW(Validate::RequireRange(1.5, 0.0, 1.0, "v", "Test"), InvalidArgumentException);
}

TEST(ValidateTest, MessageFormat) {
    try {
        Validate::RequirePositive(-3, "width", "Resize");
        FAIL() << "expected exception";
    } catch (const InvalidArgumentException& e) {
        EXPECT_EQ(std::string(e.what()), "Invalid argument: Resize: width must be > 0, got -3");
    }
}

TEST(ValidateTest, FiniteAndMin) {
    EXPECT_THROW(Validate::RequireFinite(std::numeric_limits<double>::infinity(), "a", "T"),
                 InvalidArgumentException);
    EXPECT_THROW(Validate::RequireMin(0, 1, "levels", "T"), InvalidArgumentException);
    EXPECT_NO_THROW(Validate::RequireMin(1, 1, "levels", "T"));
    EXPECT_THROW(Validate::RequireNonNegative(-0.5, "sigma", "T"), InvalidArgumentException);
}

TEST(ValidateTest, ThreadCount) {
    EXPECT_THROW(Validate::RequireThreadCount(0, "T"), InvalidArgumentException);
    EXPECT_NO_THROW(Validate::RequireThreadCount(4, "T"));
}
