#include "lattice.hpp"

#include <algorithm>

// Absorbs rounding when a cell ends exactly on the image edge
static const double EDGE_EPSILON = 1e-9;

/// A point stays only if its cell (center +- half_extent) lies inside [0, extent]
static bool fits(double center, double half_extent, int extent) {
    return center - half_extent >= -EDGE_EPSILON && center + half_extent <= extent + EDGE_EPSILON;
}

std::vector<SamplePoint> generate_lattice(int width, int height, const CircleArtConfig& config) {
    std::vector<SamplePoint> points;
    if (width <= 0 || height <= 0) {
        return points;
    }

    const double pitch = config.pitch();
    const double radius = config.sample_radius();
    const bool hexagonal = config.sampling_mode() == SamplingMode::Hexagonal;
    const double row_height = hexagonal ? pitch * HEX_ROW_HEIGHT_FACTOR : pitch;

    // Hexagonal rows are shorter than the disc is tall when spacing is zero
    const double half_cell_x = pitch / 2.0;
    const double half_cell_y = std::max(row_height / 2.0, radius);

    for (int row = 0;; row++) {
        double y = pitch / 2.0 + row * row_height;
        if (!fits(y, half_cell_y, height)) break;

        // Odd hexagonal rows sit half a pitch to the right
        double offset = (hexagonal && row % 2 == 1) ? pitch / 2.0 : 0.0;

        for (int col = 0;; col++) {
            double x = pitch / 2.0 + offset + col * pitch;
            if (!fits(x, half_cell_x, width)) break;
            points.push_back({x, y, row, col, points.size()});
        }
    }

    return points;
}
