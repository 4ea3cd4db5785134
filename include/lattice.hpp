#pragma once

#include "config.hpp"

#include <cstddef>
#include <vector>

/// sin(60 deg): vertical distance between hexagonal rows, in units of pitch
constexpr double HEX_ROW_HEIGHT_FACTOR = 0.86602540378443864676;

/// Lattice sample coordinate in pixel space
struct SamplePoint {
    double x;
    double y;
    int row;
    int column;
    size_t index;  // row-major position, fixes output order
};

/// Sample points for an image of the given size, row-major.
/// A point is kept only if its whole lattice cell (pitch wide) lies inside the
/// image, which also keeps its sampling disc inside.
std::vector<SamplePoint> generate_lattice(int width, int height, const CircleArtConfig& config);
