#ifndef BLUR_BLUR_HPP
#define BLUR_BLUR_HPP

#include "image.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>

// Gaussian blur with the full 2-D kernel, one pool job per pixel.
// Blocks until every pixel is done. Progress text goes to *log
// (nullptr for silence).
//
// Throws std::invalid_argument for sigma <= 0, workers == 0 or an empty /
// malformed source, before any work is scheduled. Throws std::runtime_error
// if any pixel job failed; no partial image is returned.
Image blur_parallel(std::uint8_t radius, double sigma, size_t workers,
                    const Image &src, std::ostream *log = &std::cout);

using PixelFn = std::function<Pixel(int x, int y)>;

// The orchestration behind blur_parallel: one pool job per (x, y) of a
// width x height image, each calling pixelAt, results gathered into a new
// image. pixelAt runs concurrently and must be safe to share. If any call
// throws, every result is still collected and then one std::runtime_error
// is thrown.
Image run_per_pixel(int width, int height, size_t workers,
                    PixelFn pixelAt, std::ostream *log = &std::cout);

// Single-threaded reference, same result as blur_parallel.
Image blur_sequential(std::uint8_t radius, double sigma,
                      const Image &src, std::ostream *log = &std::cout);

#endif
