#include "circle_art.hpp"
#include "errors.hpp"
#include "lattice.hpp"
#include "log.hpp"
#include "sampling.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

CircleArt::CircleArt(CircleArtConfig config)
    : config_(std::move(config)) {}

RenderResult CircleArt::render(const RgbaImage& image) const {
    auto points = generate_lattice(image.width(), image.height(), config_);
    if (points.empty()) {
        std::ostringstream oss;
        oss << "Image " << image.width() << "x" << image.height()
            << " is smaller than one lattice cell (pitch " << config_.pitch() << " px)";
        throw EmptySampleSet(oss.str());
    }

    log_infof("Sampling ", points.size(), " points (", to_string(config_.sampling_mode()),
              ", ", to_string(config_.render_mode()), ")...\n");

    auto sampled = sample_circles(image, points, config_, config_.worker_count());

    RenderResult result;
    result.document = assemble_document(sampled.circles, image.width(), image.height(), config_);
    result.svg = serialize_svg(result.document);
    result.points = sampled.points;
    result.circles = result.document.circles.size();
    result.skipped = sampled.points - result.circles;
    return result;
}

RenderResult CircleArt::render_file(const std::string& input_path, const std::string& output_path) const {
    log_infof("Loading: ", input_path, "\n");
    auto image = load_image(input_path);
    log_infof("Image: ", image.width(), "x", image.height(), "\n");

    auto result = render(image);

    std::ofstream out(output_path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Failed to open output file: " + output_path);
    }
    out << result.svg;
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + output_path);
    }

    return result;
}
