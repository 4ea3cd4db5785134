#pragma once

#include "config.hpp"
#include "image.hpp"
#include "svg_document.hpp"

#include <cstddef>
#include <string>

struct RenderResult {
    std::string svg;
    VectorDocument document;
    size_t points = 0;
    size_t circles = 0;
    size_t skipped = 0;
};

/// Image -> circle art SVG, end to end
class CircleArt {
public:
    explicit CircleArt(CircleArtConfig config);

    const CircleArtConfig& config() const { return config_; }

    /// Sample `image` and build the document.
    /// Throws EmptySampleSet when the image is smaller than one lattice cell.
    RenderResult render(const RgbaImage& image) const;

    /// Load `input_path`, render it and write the SVG to `output_path`
    RenderResult render_file(const std::string& input_path, const std::string& output_path) const;

private:
    CircleArtConfig config_;
};
