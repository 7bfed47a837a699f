#include "kernel.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace {
const double kPi = 3.14159265358979323846;
}

double gaussian(int dx, int dy, double sigma) {
    double s2 = sigma * sigma;
    return std::exp(-(dx * dx + dy * dy) / (2.0 * s2)) / (2.0 * kPi * s2);
}

Kernel build_kernel(int radius, double sigma) {
    if (radius < 0)
        throw std::invalid_argument("build_kernel: negative radius " + std::to_string(radius));
    if (!(sigma > 0.0))
        throw std::invalid_argument("build_kernel: sigma must be positive, got " + std::to_string(sigma));

    Kernel kernel;
    kernel.radius = radius;
    int size = kernel.side();
    kernel.weights.resize(static_cast<size_t>(size) * size);

    for (int i = 0; i < size; ++i) {
        for (int k = 0; k < size; ++k)
            kernel.weights[i * size + k] = gaussian(i - radius, k - radius, sigma);
    }
    return kernel;
}
