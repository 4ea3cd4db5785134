#include "mapper.hpp"

#include <algorithm>
#include <cmath>

double luminance(double r, double g, double b) {
    // Integer weights (Rec. 601 x 1000) keep pure white at exactly 1.0
    double lum = (299.0 * r + 587.0 * g + 114.0 * b) / 255000.0;
    return std::clamp(lum, 0.0, 1.0);
}

double halftone_radius(double lum, const CircleArtConfig& config) {
    lum = std::clamp(lum, 0.0, 1.0);
    double min_dot = config.min_dot_size();
    double max_dot = config.max_dot_size();

    double radius = 0.0;
    switch (config.render_mode()) {
        case RenderMode::HalftoneBlackOnWhite:
            radius = max_dot - lum * (max_dot - min_dot);
            break;
        case RenderMode::HalftoneWhiteOnBlack:
            radius = min_dot + lum * (max_dot - min_dot);
            break;
        case RenderMode::Color:
            radius = config.sample_radius();
            break;
    }

    return std::clamp(radius, 0.0, config.sample_radius());
}

Color paper_color(RenderMode mode) {
    return mode == RenderMode::HalftoneWhiteOnBlack ? COLOR_BLACK : COLOR_WHITE;
}

Color ink_color(RenderMode mode) {
    return mode == RenderMode::HalftoneWhiteOnBlack ? COLOR_WHITE : COLOR_BLACK;
}

static int to_channel(double v) {
    return std::clamp((int)std::lround(v), 0, 255);
}

std::optional<CircleDescriptor> map_sample(const AveragedSample& sample,
                                           const SamplePoint& point,
                                           const CircleArtConfig& config) {
    const RenderMode mode = config.render_mode();
    CircleDescriptor circle{point.index, point.x, point.y, 0.0, COLOR_BLACK, 1.0};

    switch (mode) {
        case RenderMode::Color: {
            circle.radius = config.sample_radius();
            circle.fill = {to_channel(sample.r), to_channel(sample.g), to_channel(sample.b)};
            circle.opacity = std::clamp(sample.a / 255.0, 0.0, 1.0);
            if (circle.opacity <= 0.0) {
                return std::nullopt;
            }
            break;
        }
        case RenderMode::HalftoneBlackOnWhite:
        case RenderMode::HalftoneWhiteOnBlack: {
            // Transparent areas read as bare paper
            Color paper = paper_color(mode);
            double a = std::clamp(sample.a / 255.0, 0.0, 1.0);
            double r = sample.r * a + paper.r * (1 - a);
            double g = sample.g * a + paper.g * (1 - a);
            double b = sample.b * a + paper.b * (1 - a);

            circle.radius = halftone_radius(luminance(r, g, b), config);
            circle.fill = ink_color(mode);
            break;
        }
    }

    if (!(circle.radius > 0.0)) {
        return std::nullopt;
    }
    return circle;
}
