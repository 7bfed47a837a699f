#include "blur.hpp"

#include "channel.hpp"
#include "convolve.hpp"
#include "kernel.hpp"
#include "thread_pool.hpp"

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

struct PixelResult {
    int x = 0, y = 0;
    Pixel pixel;
    bool ok = true;
    std::string error;
};

void checkSource(const Image &src) {
    if (src.width <= 0 || src.height <= 0)
        throw std::invalid_argument("blur: empty image");
    if (src.data.size() != static_cast<size_t>(src.width) * src.height * 3)
        throw std::invalid_argument("blur: pixel buffer does not match " +
                                    std::to_string(src.width) + "x" +
                                    std::to_string(src.height) + " RGB");
}

void checkSigma(double sigma) {
    if (!(sigma > 0.0))
        throw std::invalid_argument("blur: sigma must be positive");
}

void printDimensions(std::ostream *log, const Image &src) {
    if (log) *log << "Image dimensions: " << src.width << "x" << src.height << "\n";
}

} // namespace

// =========================== PARALLEL ===========================

Image run_per_pixel(int width, int height, size_t workers,
                    PixelFn pixelAt, std::ostream *log) {
    if (workers == 0)
        throw std::invalid_argument("blur: need at least one worker");
    if (width <= 0 || height <= 0)
        throw std::invalid_argument("blur: empty image");
    if (!pixelAt)
        throw std::invalid_argument("blur: no pixel function");

    unsigned long long total = static_cast<unsigned long long>(width) * height;

    auto fn = std::make_shared<const PixelFn>(std::move(pixelAt));
    auto results = std::make_shared<Channel<PixelResult>>();

    Image out = makeImage(width, height);

    ThreadPool pool(workers);

    // one job per pixel; each sends exactly one result, whatever happens
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            pool.submit([x, y, fn, results] {
                PixelResult res;
                res.x = x;
                res.y = y;
                try {
                    res.pixel = (*fn)(x, y);
                } catch (const std::exception &e) {
                    res.ok = false;
                    res.error = e.what();
                } catch (...) {
                    res.ok = false;
                    res.error = "unknown exception";
                }
                results->send(std::move(res));
            });
        }
    }

    unsigned long long received = 0;
    unsigned long long failed = 0;
    std::string firstError;
    int lastReported = 0;

    // Counts results instead of waiting for the channel to close.
    while (received < total) {
        PixelResult res = results->recv();
        ++received;

        if (res.ok) {
            setPixel(out, res.x, res.y, res.pixel);
        } else if (failed++ == 0) {
            firstError = res.error;
        }

        int percent = static_cast<int>(received * 100 / total);
        while (lastReported + 10 <= percent) {
            lastReported += 10;
            if (log) *log << lastReported << "% done\n";
        }
    }

    if (failed > 0)
        throw std::runtime_error("blur: " + std::to_string(failed) +
                                 " pixel(s) failed, first error: " + firstError);

    if (log) *log << "Done!\n";
    return out;
}

Image blur_parallel(std::uint8_t radius, double sigma, size_t workers,
                    const Image &src, std::ostream *log) {
    checkSigma(sigma);
    if (workers == 0)
        throw std::invalid_argument("blur: need at least one worker");
    checkSource(src);

    unsigned long long side = radius * 2ULL + 1;
    printDimensions(log, src);
    if (log)
        *log << "Number of calculations: "
             << static_cast<unsigned long long>(src.width) * src.height * side * side << "\n";

    std::shared_ptr<const Kernel> kernel =
        std::make_shared<const Kernel>(build_kernel(radius, sigma));
    std::shared_ptr<const Image> source = std::make_shared<const Image>(src);

    return run_per_pixel(src.width, src.height, workers,
                         [kernel, source](int x, int y) {
                             return convolve_pixel(x, y, *kernel, *source);
                         },
                         log);
}

// =========================== SEQUENTIAL ===========================

Image blur_sequential(std::uint8_t radius, double sigma,
                      const Image &src, std::ostream *log) {
    checkSigma(sigma);
    checkSource(src);
    printDimensions(log, src);

    Kernel kernel = build_kernel(radius, sigma);
    Image out = makeImage(src.width, src.height);

    for (int y = 0; y < src.height; ++y) {
        for (int x = 0; x < src.width; ++x)
            setPixel(out, x, y, convolve_pixel(x, y, kernel, src));
    }

    if (log) *log << "Done!\n";
    return out;
}
