#include "convolve.hpp"

#include <stdexcept>
#include <string>

// Truncates, after absorbing the rounding noise of sum / total so that a
// uniform neighbourhood of value v yields v and not v - 1. NaN (a kernel
// whose weights all under- or overflowed) maps to 0.
static inline unsigned char truncByte(double v) {
    v += 1e-9;
    if (!(v >= 0.0)) v = 0.0;
    if (v > 255.0) v = 255.0;
    return static_cast<unsigned char>(v);
}

Pixel convolve_pixel(int x, int y, const Kernel &kernel, const Image &src) {
    int w = src.width;
    int h = src.height;
    if (x < 0 || y < 0 || x >= w || y >= h)
        throw std::out_of_range("convolve_pixel: (" + std::to_string(x) + ", " +
                                std::to_string(y) + ") outside " +
                                std::to_string(w) + "x" + std::to_string(h));

    double r = 0, g = 0, b = 0, total = 0;
    int radius = kernel.radius;

    for (int dx = -radius; dx <= radius; ++dx) {
        int xx = x + dx;
        if (xx < 0 || xx >= w) continue;
        for (int dy = -radius; dy <= radius; ++dy) {
            int yy = y + dy;
            if (yy < 0 || yy >= h) continue;

            size_t idx = (static_cast<size_t>(yy) * w + xx) * 3;
            double kv = kernel.at(dx, dy);
            r += src.data[idx] * kv;
            g += src.data[idx + 1] * kv;
            b += src.data[idx + 2] * kv;
            total += kv;
        }
    }

    Pixel p;
    p.r = truncByte(r / total);
    p.g = truncByte(g / total);
    p.b = truncByte(b / total);
    return p;
}
