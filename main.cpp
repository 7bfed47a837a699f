#include "args.hpp"
#include "blur.hpp"
#include "image.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>

int main(int argc, char **argv) {
    BlurOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 1;
    }
    if (opts.help) {
        printUsage();
        return 1;
    }

    auto t0 = std::chrono::high_resolution_clock::now();
    Image img;
    if (!loadImage(opts.input, img)) {
        std::cerr << "Unable to load image: " << opts.input << "\n";
        return 1;
    }
    auto t1 = std::chrono::high_resolution_clock::now();

    Image blurred;
    try {
        auto radius = static_cast<std::uint8_t>(opts.radius);
        if (opts.sequential) {
            std::cout << "Sequential blur radius=" << opts.radius
                      << " sigma=" << opts.sigma << "\n";
            blurred = blur_sequential(radius, opts.sigma, img);
        } else {
            std::cout << "Worker threads (processing): " << opts.threads << "\n";
            blurred = blur_parallel(radius, opts.sigma, opts.threads, img);
        }
    } catch (const std::exception &e) {
        std::cerr << "Blur failed: " << e.what() << "\n";
        return 1;
    }
    auto t2 = std::chrono::high_resolution_clock::now();

    if (!saveImage(opts.output, blurred)) {
        std::cerr << "Unable to save image: " << opts.output << "\n";
        return 1;
    }
    auto t3 = std::chrono::high_resolution_clock::now();

    std::cout << "Saved to " << opts.output << "\n";
    std::cout << "=== Timing ===\n";
    std::cout << "Load:       " << std::chrono::duration<double, std::milli>(t1 - t0).count() << " ms\n";
    std::cout << "Process:    " << std::chrono::duration<double, std::milli>(t2 - t1).count() << " ms\n";
    std::cout << "Save:       " << std::chrono::duration<double, std::milli>(t3 - t2).count() << " ms\n";
    std::cout << "Total:      " << std::chrono::duration<double, std::milli>(t3 - t0).count() << " ms\n";
    return 0;
}
