#include "config.hpp"
#include "errors.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

static void require_finite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw InvalidConfiguration(std::string(name) + " must be a finite number");
    }
}

CircleArtConfig CircleArtConfig::from_options(const CircleArtOptions& o) {
    require_finite(o.circle_diameter, "Circle diameter");
    require_finite(o.circle_spacing, "Circle spacing");

    if (o.circle_diameter <= 0.0) {
        throw InvalidConfiguration("Circle diameter must be positive");
    }
    if (o.circle_spacing < 0.0) {
        throw InvalidConfiguration("Circle spacing cannot be negative");
    }

    if (o.output_width_mm.has_value() != o.output_height_mm.has_value()) {
        throw InvalidConfiguration("Output width and height must be given together");
    }
    if (o.output_width_mm) {
        require_finite(*o.output_width_mm, "Output width");
        require_finite(*o.output_height_mm, "Output height");
        if (*o.output_width_mm <= 0.0 || *o.output_height_mm <= 0.0) {
            throw InvalidConfiguration("Output dimensions must be positive");
        }
    }

    if (o.min_dot_size.has_value() != o.max_dot_size.has_value()) {
        throw InvalidConfiguration("Minimum and maximum dot size must be given together");
    }
    if (o.render_mode != RenderMode::Color && !o.min_dot_size) {
        throw InvalidConfiguration("Halftone modes require minimum and maximum dot size");
    }
    if (o.min_dot_size) {
        double min_dot = *o.min_dot_size;
        double max_dot = *o.max_dot_size;
        require_finite(min_dot, "Minimum dot size");
        require_finite(max_dot, "Maximum dot size");

        if (min_dot < 0.0) {
            throw InvalidConfiguration("Minimum dot size cannot be negative");
        }
        if (min_dot >= max_dot) {
            std::ostringstream oss;
            oss << "Minimum dot size (" << min_dot << ") must be smaller than maximum (" << max_dot << ")";
            throw InvalidConfiguration(oss.str());
        }
        if (max_dot > o.circle_diameter) {
            std::ostringstream oss;
            oss << "Maximum dot size (" << max_dot << ") exceeds circle diameter (" << o.circle_diameter << ")";
            throw InvalidConfiguration(oss.str());
        }
    }

    if (o.worker_count < 0) {
        throw InvalidConfiguration("Worker count cannot be negative");
    }

    return CircleArtConfig(o);
}

const char* to_string(SamplingMode mode) {
    switch (mode) {
        case SamplingMode::Grid: return "grid";
        case SamplingMode::Hexagonal: return "hexagonal";
    }
    return "unknown";
}

const char* to_string(RenderMode mode) {
    switch (mode) {
        case RenderMode::Color: return "color";
        case RenderMode::HalftoneBlackOnWhite: return "halftone-black";
        case RenderMode::HalftoneWhiteOnBlack: return "halftone-white";
    }
    return "unknown";
}

SamplingMode parse_sampling_mode(const std::string& text) {
    if (text == "grid") return SamplingMode::Grid;
    if (text == "hexagonal" || text == "hex") return SamplingMode::Hexagonal;
    throw std::invalid_argument("Unknown sampling mode: " + text);
}

RenderMode parse_render_mode(const std::string& text) {
    if (text == "color") return RenderMode::Color;
    if (text == "halftone-black") return RenderMode::HalftoneBlackOnWhite;
    if (text == "halftone-white") return RenderMode::HalftoneWhiteOnBlack;
    throw std::invalid_argument("Unknown render mode: " + text);
}

double parse_option_number(const std::string& option, const std::string& value) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw std::invalid_argument("Option " + option + " expects a number, got '" + value + "'");
    }
    return v;
}

int parse_option_int(const std::string& option, const std::string& value) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw std::invalid_argument("Option " + option + " expects an integer, got '" + value + "'");
    }
    return v;
}
