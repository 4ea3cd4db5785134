#pragma once

#include <cstdint>
#include <string>
#include <vector>

/// 8-bit RGBA pixel
struct Rgba {
    uint8_t r, g, b, a;
};

/// Read-only RGBA8 pixel buffer, rows packed top to bottom
class RgbaImage {
public:
    RgbaImage() = default;

    /// Takes ownership of `pixels`; size must be width * height * 4
    RgbaImage(int width, int height, std::vector<uint8_t> pixels);

    /// Every pixel set to `fill`
    RgbaImage(int width, int height, Rgba fill);

    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return width_ == 0 || height_ == 0; }

    Rgba at(int x, int y) const {
        const uint8_t* p = &pixels_[((size_t)y * width_ + x) * 4];
        return {p[0], p[1], p[2], p[3]};
    }

    void set(int x, int y, Rgba value);

    const std::vector<uint8_t>& data() const { return pixels_; }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> pixels_;
};

/// Decode an image file (any format stb_image understands) to RGBA8.
/// Throws ImageLoadError on failure.
RgbaImage load_image(const std::string& path);
