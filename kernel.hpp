#ifndef BLUR_KERNEL_HPP
#define BLUR_KERNEL_HPP

#include <vector>

// Square 2-D gaussian, side 2*radius+1. Weights are the raw density and do
// not sum to 1; convolve_pixel divides by the weight actually used.
struct Kernel {
    int radius = 0;
    std::vector<double> weights;

    int side() const { return radius * 2 + 1; }

    // dx, dy in [-radius, radius]
    double at(int dx, int dy) const {
        return weights[(dx + radius) * side() + (dy + radius)];
    }
};

double gaussian(int dx, int dy, double sigma);

// throws std::invalid_argument for radius < 0 or sigma <= 0
Kernel build_kernel(int radius, double sigma);

#endif
