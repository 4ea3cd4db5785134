#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
#include "image.hpp"
#include "errors.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

RgbaImage::RgbaImage(int width, int height, std::vector<uint8_t> pixels)
    : width_(width), height_(height), pixels_(std::move(pixels)) {
    if (width < 0 || height < 0) {
        throw std::invalid_argument("Image dimensions must not be negative");
    }
    if (pixels_.size() != (size_t)width * height * 4) {
        std::ostringstream oss;
        oss << "Pixel buffer holds " << pixels_.size() << " bytes, expected "
            << (size_t)width * height * 4 << " for " << width << "x" << height;
        throw std::invalid_argument(oss.str());
    }
}

RgbaImage::RgbaImage(int width, int height, Rgba fill)
    : RgbaImage(width, height, std::vector<uint8_t>((size_t)std::max(width, 0) * std::max(height, 0) * 4)) {
    for (size_t i = 0; i < pixels_.size(); i += 4) {
        pixels_[i + 0] = fill.r;
        pixels_[i + 1] = fill.g;
        pixels_[i + 2] = fill.b;
        pixels_[i + 3] = fill.a;
    }
}

void RgbaImage::set(int x, int y, Rgba value) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        throw std::out_of_range("Pixel coordinate outside image");
    }
    uint8_t* p = &pixels_[((size_t)y * width_ + x) * 4];
    p[0] = value.r;
    p[1] = value.g;
    p[2] = value.b;
    p[3] = value.a;
}

RgbaImage load_image(const std::string& path) {
    int w, h, channels;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 4);  // Force RGBA
    if (!data) {
        throw ImageLoadError("Failed to load image: " + path +
                             " (" + stbi_failure_reason() + ")");
    }

    std::vector<uint8_t> pixels(data, data + (size_t)w * h * 4);
    stbi_image_free(data);

    return RgbaImage(w, h, std::move(pixels));
}
