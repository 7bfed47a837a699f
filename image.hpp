#ifndef BLUR_IMAGE_HPP
#define BLUR_IMAGE_HPP

#include <string>
#include <vector>

// RGB raster, row-major, 3 bytes per pixel.
struct Image {
    int width = 0, height = 0, channels = 0;
    std::vector<unsigned char> data;
};

struct Pixel {
    unsigned char r = 0, g = 0, b = 0;
};

inline bool operator==(const Pixel &a, const Pixel &b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const Pixel &a, const Pixel &b) {
    return !(a == b);
}

// zero-filled RGB image
Image makeImage(int width, int height);

Pixel getPixel(const Image &img, int x, int y);
void setPixel(Image &img, int x, int y, const Pixel &p);

bool loadImage(const std::string &filename, Image &img);
bool saveImage(const std::string &filename, const Image &img);

#endif
