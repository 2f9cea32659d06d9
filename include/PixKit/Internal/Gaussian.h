#pragma once

/**
 * @file Gaussian.h
 * @brief Gaussian kernel generation for blur-based filters
 *
 * Used by:
 * - Filter module (GaussBlur, Watercolor)
 */

#include <cstdint>
#include <vector>

namespace Pix::Kit::Internal {

/**
 * @brief Gaussian kernel generator
 *
 * All kernels are returned as std::vector<double>.
 */
class Gaussian {
public:
    /**
     * @brief Map a blur sigma to an integer kernel radius
     * @return round(sigma), never negative
     */
    static int32_t RadiusFromSigma(double sigma);

    /**
     * @brief Standard deviation used for the weights of a given radius
     *
     * Returns radius * 2/3, so the kernel spans 1.5 standard deviations
     * on each side of the center.
     */
    static double SigmaForRadius(int32_t radius);

    /**
     * @brief Generate 1D Gaussian kernel (smoothing)
     * @param sigma Standard deviation (> 0)
     * @param radius Half width; kernel size is 2 * radius + 1
     * @return Weights G(x) = exp(-x² / (2σ²)), normalized to sum 1.0
     */
    static std::vector<double> Kernel1D(double sigma, int32_t radius);

    /**
     * @brief Normalized kernel for a radius, weights from SigmaForRadius()
     *
     * Radius 0 yields the identity kernel {1.0}.
     */
    static std::vector<double> KernelForRadius(int32_t radius);
};

} // namespace Pix::Kit::Internal
