/**
 * @file Convolution.cpp
 * @brief Convolution operations implementation
 */

#include <PixKit/Internal/Convolution.h>

#include <algorithm>
#include <vector>

namespace Pix::Kit::Internal {

namespace {

void ConvolveRow(const uint8_t* src, double* dst, int32_t width, int32_t height,
                 const double* kernel, int32_t kernelSize,
                 BorderMode border, double borderValue) {
    int32_t halfK = kernelSize / 2;

    for (int32_t y = 0; y < height; ++y) {
        const uint8_t* srcRow = src + static_cast<size_t>(y) * width;
        double* dstRow = dst + static_cast<size_t>(y) * width;

        for (int32_t x = 0; x < width; ++x) {
            double sum = 0.0;
            for (int32_t k = 0; k < kernelSize; ++k) {
                int32_t sx = BorderIndex(x + k - halfK, width, border);
                double v = (sx < 0) ? borderValue : static_cast<double>(srcRow[sx]);
                sum += v * kernel[k];
            }
            dstRow[x] = sum;
        }
    }
}

void ConvolveCol(const double* src, double* dst, int32_t width, int32_t height,
                 const double* kernel, int32_t kernelSize,
                 BorderMode border, double borderValue) {
    int32_t halfK = kernelSize / 2;

    for (int32_t y = 0; y < height; ++y) {
        double* dstRow = dst + static_cast<size_t>(y) * width;

        for (int32_t x = 0; x < width; ++x) {
            double sum = 0.0;
            for (int32_t k = 0; k < kernelSize; ++k) {
                int32_t sy = BorderIndex(y + k - halfK, height, border);
                double v = (sy < 0) ? borderValue : src[static_cast<size_t>(sy) * width + x];
                sum += v * kernel[k];
            }
            dstRow[x] = sum;
        }
    }
}

} // anonymous namespace

int32_t BorderIndex(int32_t i, int32_t size, BorderMode mode) {
    if (i >= 0 && i < size) {
        return i;
    }

    switch (mode) {
        case BorderMode::Replicate:
            return std::max(0, std::min(i, size - 1));
        case BorderMode::Constant:
            return -1;
    }
    return -1;
}

void ConvolveSeparable(const uint8_t* src, double* dst, int32_t width, int32_t height,
                       const double* kernelX, int32_t kernelXSize,
                       const double* kernelY, int32_t kernelYSize,
                       BorderMode border, double borderValue) {
    std::vector<double> temp(static_cast<size_t>(width) * height);
    ConvolveRow(src, temp.data(), width, height, kernelX, kernelXSize, border, borderValue);
    ConvolveCol(temp.data(), dst, width, height, kernelY, kernelYSize, border, borderValue);
}

} // namespace Pix::Kit::Internal
