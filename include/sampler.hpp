#pragma once

#include "image.hpp"

#include <cstddef>
#include <optional>

/// Channel-wise mean of the pixels under one sampling disc
struct AveragedSample {
    double r, g, b, a;  // 0..255
    size_t coverage;    // pixels averaged
};

/// Average every pixel whose center (px + 0.5, py + 0.5) lies within `radius`
/// of (x, y). Returns nullopt when no pixel is covered.
std::optional<AveragedSample> sample_disc(const RgbaImage& image, double x, double y, double radius);
