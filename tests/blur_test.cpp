#include "blur.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

Image noiseImage(int w, int h, unsigned seed) {
    Image img = makeImage(w, h);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto &v : img.data) v = static_cast<unsigned char>(dist(gen));
    return img;
}

std::vector<std::string> lines(const std::string &text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);) out.push_back(line);
    return out;
}

} // namespace

TEST_CASE("blur: output has the source dimensions", "[blur]")
{
    Image src = noiseImage(7, 3, 1);

    Image par = blur_parallel(2, 1.0, 4, src, nullptr);
    REQUIRE(par.width == 7);
    REQUIRE(par.height == 3);
    REQUIRE(par.data.size() == src.data.size());

    Image seq = blur_sequential(2, 1.0, src, nullptr);
    REQUIRE(seq.width == 7);
    REQUIRE(seq.height == 3);
}

TEST_CASE("blur: parallel and sequential agree pixel for pixel", "[blur]")
{
    Image src = noiseImage(23, 17, 42);

    for (int radius : {0, 1, 3, 6}) {
        for (double sigma : {0.5, 2.0, 10.0}) {
            Image seq = blur_sequential(static_cast<std::uint8_t>(radius), sigma, src, nullptr);
            Image par = blur_parallel(static_cast<std::uint8_t>(radius), sigma, 3, src, nullptr);
            REQUIRE(seq.data == par.data);
        }
    }
}

TEST_CASE("blur: result does not depend on the worker count", "[blur]")
{
    Image src = noiseImage(16, 11, 7);
    Image ref = blur_parallel(2, 1.5, 1, src, nullptr);

    for (size_t workers : {2, 8, 64})
        REQUIRE(blur_parallel(2, 1.5, workers, src, nullptr).data == ref.data);
}

TEST_CASE("blur: radius 0 returns the source unchanged", "[blur]")
{
    Image src = noiseImage(9, 9, 3);

    REQUIRE(blur_sequential(0, 0.7, src, nullptr).data == src.data);
    REQUIRE(blur_parallel(0, 0.7, 4, src, nullptr).data == src.data);
}

TEST_CASE("blur: a 1x1 image is left as is for any radius", "[blur]")
{
    Image src = makeImage(1, 1);
    setPixel(src, 0, 0, Pixel{31, 128, 254});

    for (int radius : {1, 2, 10}) {
        auto r = static_cast<std::uint8_t>(radius);
        REQUIRE(getPixel(blur_parallel(r, 4.0, 2, src, nullptr), 0, 0) == (Pixel{31, 128, 254}));
        REQUIRE(getPixel(blur_sequential(r, 4.0, src, nullptr), 0, 0) == (Pixel{31, 128, 254}));
    }
}

TEST_CASE("blur: 4x4 black image stays black", "[blur]")
{
    Image src = makeImage(4, 4);

    Image par = blur_parallel(1, 1.0, 4, src, nullptr);
    Image seq = blur_sequential(1, 1.0, src, nullptr);

    REQUIRE(par.width == 4);
    REQUIRE(par.height == 4);
    REQUIRE(par.data == std::vector<unsigned char>(48, 0));
    REQUIRE(seq.data == std::vector<unsigned char>(48, 0));
}

TEST_CASE("blur: a bright spot spreads to its neighbours", "[blur]")
{
    Image src = makeImage(5, 5);
    setPixel(src, 2, 2, Pixel{255, 255, 255});

    Image out = blur_parallel(1, 1.0, 2, src, nullptr);
    Pixel center = getPixel(out, 2, 2);
    Pixel side = getPixel(out, 1, 2);
    Pixel diag = getPixel(out, 1, 1);

    REQUIRE(center.r < 255);
    REQUIRE(side.r > 0);
    REQUIRE(side.r < center.r);
    REQUIRE(diag.r < side.r);
    REQUIRE(getPixel(out, 0, 0) == (Pixel{0, 0, 0}));
}

TEST_CASE("blur: bad parameters fail before any work", "[blur]")
{
    Image src = makeImage(2, 2);

    SECTION("sigma") {
        REQUIRE_THROWS_AS(blur_parallel(1, 0.0, 2, src, nullptr), std::invalid_argument);
        REQUIRE_THROWS_AS(blur_parallel(1, -1.0, 2, src, nullptr), std::invalid_argument);
        REQUIRE_THROWS_AS(blur_sequential(1, 0.0, src, nullptr), std::invalid_argument);
        REQUIRE_THROWS_AS(blur_sequential(1, std::numeric_limits<double>::quiet_NaN(), src, nullptr),
                          std::invalid_argument);
    }
    SECTION("workers") {
        REQUIRE_THROWS_AS(blur_parallel(1, 1.0, 0, src, nullptr), std::invalid_argument);
    }
    SECTION("empty image") {
        Image empty;
        REQUIRE_THROWS_AS(blur_parallel(1, 1.0, 2, empty, nullptr), std::invalid_argument);
        REQUIRE_THROWS_AS(blur_sequential(1, 1.0, empty, nullptr), std::invalid_argument);
    }
    SECTION("pixel buffer of the wrong size") {
        Image broken = makeImage(3, 3);
        broken.data.pop_back();
        REQUIRE_THROWS_AS(blur_parallel(1, 1.0, 2, broken, nullptr), std::invalid_argument);
    }
}

TEST_CASE("blur_parallel: reports each tenth of progress once", "[blur][progress]")
{
    std::ostringstream log;

    SECTION("large image") {
        blur_parallel(1, 1.0, 4, noiseImage(37, 29, 5), &log);
    }
    SECTION("image smaller than ten pixels") {
        blur_parallel(1, 1.0, 4, noiseImage(3, 1, 5), &log);
    }

    std::vector<std::string> out = lines(log.str());
    std::vector<std::string> progress;
    for (const auto &l : out) {
        if (l.find("% done") != std::string::npos) progress.push_back(l);
    }

    REQUIRE(progress.size() == 10);
    for (int i = 0; i < 10; ++i)
        REQUIRE(progress[i] == std::to_string((i + 1) * 10) + "% done");

    REQUIRE(out.front().rfind("Image dimensions: ", 0) == 0);
    REQUIRE(out.back() == "Done!");
}

TEST_CASE("blur_parallel: header lines", "[blur][progress]")
{
    std::ostringstream log;
    blur_parallel(2, 1.0, 2, makeImage(4, 3), &log);

    std::vector<std::string> out = lines(log.str());
    REQUIRE(out.size() >= 2);
    REQUIRE(out[0] == "Image dimensions: 4x3");
    // 12 pixels * 25 taps
    REQUIRE(out[1] == "Number of calculations: 300");
}

TEST_CASE("blur: extreme sigma stays well defined", "[blur]")
{
    Image src = makeImage(3, 3);
    for (auto &v : src.data) v = 100;

    for (double sigma : {1e200, 1e-200}) {
        REQUIRE(blur_sequential(1, sigma, src, nullptr).data == std::vector<unsigned char>(27, 0));
        REQUIRE(blur_parallel(1, sigma, 2, src, nullptr).data == std::vector<unsigned char>(27, 0));
    }
}

TEST_CASE("run_per_pixel: gathers every pixel", "[blur][orchestrator]")
{
    Image out = run_per_pixel(6, 5, 3, [](int x, int y) {
        return Pixel{static_cast<unsigned char>(x), static_cast<unsigned char>(y), 7};
    }, nullptr);

    REQUIRE(out.width == 6);
    REQUIRE(out.height == 5);
    for (int y = 0; y < 5; ++y)
        for (int x = 0; x < 6; ++x)
            REQUIRE(getPixel(out, x, y) == (Pixel{static_cast<unsigned char>(x),
                                                  static_cast<unsigned char>(y), 7}));
}

TEST_CASE("run_per_pixel: failing pixels fail the whole run", "[blur][orchestrator]")
{
    std::atomic<int> calls{0};
    std::ostringstream log;

    SECTION("std::exception") {
        auto pixelAt = [&calls](int x, int y) -> Pixel {
            ++calls;
            if ((x == 1 && y == 2) || (x == 3 && y == 0))
                throw std::out_of_range("bad pixel");
            return Pixel{1, 2, 3};
        };
        REQUIRE_THROWS_WITH(run_per_pixel(4, 4, 3, pixelAt, &log),
                            Catch::Contains("2 pixel(s) failed") &&
                            Catch::Contains("bad pixel"));
    }
    SECTION("exception not derived from std::exception") {
        auto pixelAt = [&calls](int x, int y) -> Pixel {
            ++calls;
            if (x == 0 && y == 0) throw 42;
            return Pixel{1, 2, 3};
        };
        REQUIRE_THROWS_WITH(run_per_pixel(4, 4, 3, pixelAt, &log),
                            Catch::Contains("1 pixel(s) failed") &&
                            Catch::Contains("unknown exception"));
    }

    // every job ran and was collected before the error surfaced
    REQUIRE(calls.load() == 16);
    REQUIRE(log.str().find("100% done") != std::string::npos);
    REQUIRE(log.str().find("Done!") == std::string::npos);
}

TEST_CASE("run_per_pixel: rejects bad arguments", "[blur][orchestrator]")
{
    auto black = [](int, int) { return Pixel{}; };
    REQUIRE_THROWS_AS(run_per_pixel(2, 2, 0, black, nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(run_per_pixel(0, 2, 1, black, nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(run_per_pixel(2, 2, 1, PixelFn(), nullptr), std::invalid_argument);
}
