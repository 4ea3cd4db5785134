#pragma once

#include "color.hpp"
#include "config.hpp"
#include "mapper.hpp"

#include <optional>
#include <string>
#include <vector>

/// Circle in output units
struct DocumentCircle {
    double cx;
    double cy;
    double r;
    Color fill;
    double opacity;
};

/// Scalable circle-art document, ready to serialize
struct VectorDocument {
    double width = 0.0;   // output units
    double height = 0.0;
    std::string unit;     // "mm", or empty for pixel units
    double scale_x = 1.0; // output units per source pixel
    double scale_y = 1.0;
    std::optional<Color> background;
    std::vector<DocumentCircle> circles;
};

/// Lay out circles (pixel space, lattice order) on a page of the configured size.
/// Circles too small to show at output precision are left out.
VectorDocument assemble_document(const std::vector<CircleDescriptor>& circles,
                                 int image_width, int image_height,
                                 const CircleArtConfig& config);

/// SVG 1.1 text of the document; background first, circles in order
std::string serialize_svg(const VectorDocument& document);

/// Fixed 3-decimal rendering with trailing zeros removed ("1.5", "2", "0.125")
std::string format_number(double value);
