#pragma once

#include "color.hpp"

#include <optional>
#include <string>

enum class SamplingMode {
    Grid,
    Hexagonal,
};

enum class RenderMode {
    Color,
    HalftoneBlackOnWhite,
    HalftoneWhiteOnBlack,
};

/// Raw, unvalidated options as collected from the command line or a caller
struct CircleArtOptions {
    double circle_diameter = 10.0;
    double circle_spacing = 2.0;
    std::optional<double> output_width_mm;
    std::optional<double> output_height_mm;
    std::optional<Color> background;
    SamplingMode sampling_mode = SamplingMode::Grid;
    RenderMode render_mode = RenderMode::Color;
    std::optional<double> min_dot_size;
    std::optional<double> max_dot_size;
    int worker_count = 0;  // 0 = hardware concurrency
};

/// Validated parameter bundle shared read-only by every pipeline stage
class CircleArtConfig {
public:
    /// Validate `options`; throws InvalidConfiguration on the first problem found
    static CircleArtConfig from_options(const CircleArtOptions& options);

    double circle_diameter() const { return options_.circle_diameter; }
    double circle_spacing() const { return options_.circle_spacing; }
    const std::optional<double>& output_width_mm() const { return options_.output_width_mm; }
    const std::optional<double>& output_height_mm() const { return options_.output_height_mm; }
    bool has_physical_size() const { return options_.output_width_mm.has_value(); }
    const std::optional<Color>& background() const { return options_.background; }
    SamplingMode sampling_mode() const { return options_.sampling_mode; }
    RenderMode render_mode() const { return options_.render_mode; }
    bool is_halftone() const { return options_.render_mode != RenderMode::Color; }

    /// Halftone dot radius bounds; only meaningful when is_halftone()
    double min_dot_size() const { return options_.min_dot_size.value_or(0.0); }
    double max_dot_size() const { return options_.max_dot_size.value_or(sample_radius()); }

    int worker_count() const { return options_.worker_count; }

    /// Center-to-center lattice distance
    double pitch() const { return options_.circle_diameter + options_.circle_spacing; }
    double sample_radius() const { return options_.circle_diameter / 2.0; }

private:
    explicit CircleArtConfig(const CircleArtOptions& options) : options_(options) {}

    CircleArtOptions options_;
};

const char* to_string(SamplingMode mode);
const char* to_string(RenderMode mode);

/// "grid", "hexagonal" / "hex". Throws std::invalid_argument.
SamplingMode parse_sampling_mode(const std::string& text);

/// "color", "halftone-black", "halftone-white". Throws std::invalid_argument.
RenderMode parse_render_mode(const std::string& text);

/// Whole-string decimal number for command line option `option`. Throws std::invalid_argument.
double parse_option_number(const std::string& option, const std::string& value);

/// Whole-string integer; "2.5" and out-of-range values are rejected. Throws std::invalid_argument.
int parse_option_int(const std::string& option, const std::string& value);
