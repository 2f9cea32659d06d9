/**
 * @file test_convolution.cpp
 * @brief Unit tests for Internal/Convolution.h
 */

#include <PixKit/Internal/Convolution.h>
#include <gtest/gtest.h>

#include <vector>

using namespace Pix::Kit::Internal;

// ============================================================================
// Border Handling
// ============================================================================

TEST(BorderIndexTest, InsideIsUnchanged) {
    EXPECT_EQ(BorderIndex(3, 10, BorderMode::Replicate), 3);
    EXPECT_EQ(BorderIndex(0, 10, BorderMode::Constant), 0);
}

TEST(BorderIndexTest, Replicate) {
    EXPECT_EQ(BorderIndex(-2, 5, BorderMode::Replicate), 0);
    EXPECT_EQ(BorderIndex(7, 5, BorderMode::Replicate), 4);
}

TEST(BorderIndexTest, ConstantIsOutside) {
    EXPECT_EQ(BorderIndex(-1, 5, BorderMode::Constant), -1);
    EXPECT_EQ(BorderIndex(5, 5, BorderMode::Constant), -1);
}

// ============================================================================
// Separable Convolution
// ============================================================================

class ConvolutionTest : public ::testing::Test {
protected:
    const std::vector<double> box3_{1.0 / 3.0, 1.0 / 3.0, 1.0 / 3.0};
    const std::vector<double> identity_{1.0};
};

TEST_F(ConvolutionTest, ConstantImageIsPreserved) {
    std::vector<uint8_t> src(8 * 6, 100);
    std::vector<double> dst(src.size());
    ConvolveSeparable(src.data(), dst.data(), 8, 6,
                      box3_.data(), 3, box3_.data(), 3);
    for (double v : dst) {
        EXPECT_NEAR(v, 100.0, 1e-9);
    }
}

TEST_F(ConvolutionTest, RowPassAveragesNeighbours) {
    std::vector<uint8_t> src = {0, 3, 6, 9};
    std::vector<double> dst(src.size());
    ConvolveSeparable(src.data(), dst.data(), 4, 1,
                      box3_.data(), 3, identity_.data(), 1);
    EXPECT_NEAR(dst[1], 3.0, 1e-9);
    EXPECT_NEAR(dst[2], 6.0, 1e-9);
    // Replicate: (0 + 0 + 3) / 3
    EXPECT_NEAR(dst[0], 1.0, 1e-9);
}

TEST_F(ConvolutionTest, ColumnPassUsesVerticalNeighbours) {
    std::vector<uint8_t> src = {0, 3, 6};   // 1 wide, 3 tall
    std::vector<double> dst(3);
    ConvolveSeparable(src.data(), dst.data(), 1, 3,
                      identity_.data(), 1, box3_.data(), 3);
    EXPECT_NEAR(dst[1], 3.0, 1e-9);
    EXPECT_NEAR(dst[2], 5.0, 1e-9);
}

TEST_F(ConvolutionTest, ConstantBorderUsesValue) {
    std::vector<uint8_t> src = {3};
    std::vector<double> dst(1);
    ConvolveSeparable(src.data(), dst.data(), 1, 1,
                      box3_.data(), 3, identity_.data(), 1,
                      BorderMode::Constant, 6.0);
    EXPECT_NEAR(dst[0], 5.0, 1e-9);
}
