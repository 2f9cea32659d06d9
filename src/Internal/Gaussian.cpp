/**
 * @file Gaussian.cpp
 * @brief Gaussian kernel generation
 */

#include <PixKit/Internal/Gaussian.h>

#include <cmath>

namespace Pix::Kit::Internal {

int32_t Gaussian::RadiusFromSigma(double sigma) {
    if (!(sigma > 0.0)) {
        return 0;
    }
    return static_cast<int32_t>(std::lround(sigma));
}

double Gaussian::SigmaForRadius(int32_t radius) {
    return radius * 2.0 / 3.0;
}

std::vector<double> Gaussian::Kernel1D(double sigma, int32_t radius) {
    if (radius <= 0 || !(sigma > 0.0)) {
        return {1.0};
    }

    int32_t size = 2 * radius + 1;
    std::vector<double> kernel(size);
    double sigma2 = 2.0 * sigma * sigma;
    double sum = 0.0;

    for (int32_t i = 0; i < size; ++i) {
        double x = static_cast<double>(i - radius);
        kernel[i] = std::exp(-x * x / sigma2);
        sum += kernel[i];
    }

    for (double& k : kernel) {
        k /= sum;
    }

    return kernel;
}

std::vector<double> Gaussian::KernelForRadius(int32_t radius) {
    return Kernel1D(SigmaForRadius(radius), radius);
}

} // namespace Pix::Kit::Internal
