#pragma once

#include "color.hpp"
#include "config.hpp"
#include "lattice.hpp"
#include "sampler.hpp"

#include <cstddef>
#include <optional>

/// One renderable circle, in pixel space
struct CircleDescriptor {
    size_t index;  // originating SamplePoint::index
    double cx;
    double cy;
    double radius;
    Color fill;
    double opacity;  // 0..1
};

/// Perceptual luminance of an RGB triple (0..255 per channel), normalized to [0, 1]
double luminance(double r, double g, double b);

/// Dot radius for a luminance in [0, 1], clamped to [0, diameter / 2].
/// Only valid for the halftone render modes.
double halftone_radius(double lum, const CircleArtConfig& config);

/// Background the halftone dots are printed on
Color paper_color(RenderMode mode);

/// Dot color for the render mode
Color ink_color(RenderMode mode);

/// Turn an averaged sample into a circle. Returns nullopt when the circle
/// would have no area.
std::optional<CircleDescriptor> map_sample(const AveragedSample& sample,
                                           const SamplePoint& point,
                                           const CircleArtConfig& config);
