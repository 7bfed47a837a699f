#ifndef BLUR_CONVOLVE_HPP
#define BLUR_CONVOLVE_HPP

#include "image.hpp"
#include "kernel.hpp"

// Weighted average of the in-bounds neighbourhood of (x, y). Taps that fall
// outside the image are left out of both the sum and the divisor.
// Throws std::out_of_range if (x, y) is not inside src.
Pixel convolve_pixel(int x, int y, const Kernel &kernel, const Image &src);

#endif
