#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION

#include "stb_image.h"
#include "stb_image_write.h"

#include "image.hpp"

#include <cctype>
#include <iostream>

Image makeImage(int width, int height) {
    Image img;
    img.width = width;
    img.height = height;
    img.channels = 3;
    img.data.assign(static_cast<size_t>(width) * height * 3, 0);
    return img;
}

Pixel getPixel(const Image &img, int x, int y) {
    size_t idx = (static_cast<size_t>(y) * img.width + x) * 3;
    Pixel p;
    p.r = img.data[idx];
    p.g = img.data[idx + 1];
    p.b = img.data[idx + 2];
    return p;
}

void setPixel(Image &img, int x, int y, const Pixel &p) {
    size_t idx = (static_cast<size_t>(y) * img.width + x) * 3;
    img.data[idx]     = p.r;
    img.data[idx + 1] = p.g;
    img.data[idx + 2] = p.b;
}

// ---- Load ----
bool loadImage(const std::string &filename, Image &img) {
    unsigned char *pixels = stbi_load(filename.c_str(),
                                      &img.width,
                                      &img.height,
                                      &img.channels,
                                      3); // force RGB
    if (!pixels) {
        std::cerr << "stb_image: " << stbi_failure_reason() << "\n";
        return false;
    }

    img.channels = 3;
    img.data.assign(pixels, pixels + static_cast<size_t>(img.width) * img.height * 3);
    stbi_image_free(pixels);
    return true;
}

// ---- Save ----
bool saveImage(const std::string &filename, const Image &img) {
    auto pos = filename.find_last_of('.');
    if (pos == std::string::npos) {
        std::cerr << "Output file has no extension: " << filename << "\n";
        return false;
    }

    std::string ext = filename.substr(pos + 1);
    for (auto &c : ext) c = std::tolower(static_cast<unsigned char>(c));

    if (ext == "png")
        return stbi_write_png(filename.c_str(),
                              img.width, img.height,
                              3, img.data.data(),
                              img.width * 3) != 0;

    if (ext == "bmp")
        return stbi_write_bmp(filename.c_str(),
                              img.width, img.height,
                              3, img.data.data()) != 0;

    if (ext == "jpg" || ext == "jpeg")
        return stbi_write_jpg(filename.c_str(),
                              img.width, img.height,
                              3, img.data.data(),
                              95) != 0;

    if (ext == "tga")
        return stbi_write_tga(filename.c_str(),
                              img.width, img.height,
                              3, img.data.data()) != 0;

    std::cerr << "Unsupported output format: " << ext << "\n";
    return false;
}
