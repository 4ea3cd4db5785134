#include "svg_document.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

std::string format_number(double value) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(3) << value;
    std::string s = oss.str();

    if (s.find('.') != std::string::npos) {
        while (s.back() == '0') s.pop_back();
        if (s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

VectorDocument assemble_document(const std::vector<CircleDescriptor>& circles,
                                 int image_width, int image_height,
                                 const CircleArtConfig& config) {
    if (image_width <= 0 || image_height <= 0) {
        throw std::invalid_argument("Image dimensions must be positive");
    }

    VectorDocument doc;

    if (config.has_physical_size()) {
        doc.width = *config.output_width_mm();
        doc.height = *config.output_height_mm();
        doc.unit = "mm";
        // Differing aspect ratios stretch the layout; circles stay round
        doc.scale_x = doc.width / image_width;
        doc.scale_y = doc.height / image_height;
    } else {
        doc.width = image_width;
        doc.height = image_height;
    }

    if (config.is_halftone()) {
        doc.background = paper_color(config.render_mode());
    } else {
        doc.background = config.background();
    }

    const double radius_scale = std::min(doc.scale_x, doc.scale_y);
    doc.circles.reserve(circles.size());
    for (const auto& c : circles) {
        double r = c.radius * radius_scale;
        // Would serialize as r="0"
        if (format_number(r) == "0") continue;
        doc.circles.push_back({c.cx * doc.scale_x, c.cy * doc.scale_y, r, c.fill, c.opacity});
    }

    return doc;
}

std::string serialize_svg(const VectorDocument& doc) {
    const std::string w = format_number(doc.width);
    const std::string h = format_number(doc.height);

    std::ostringstream out;
    out.imbue(std::locale::classic());

    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\""
        << " width=\"" << w << doc.unit << "\""
        << " height=\"" << h << doc.unit << "\""
        << " viewBox=\"0 0 " << w << " " << h << "\">\n";

    if (doc.background) {
        out << "<rect x=\"0\" y=\"0\" width=\"" << w << "\" height=\"" << h
            << "\" fill=\"" << to_svg_color(*doc.background) << "\"/>\n";
    }

    for (const auto& c : doc.circles) {
        out << "<circle cx=\"" << format_number(c.cx)
            << "\" cy=\"" << format_number(c.cy)
            << "\" r=\"" << format_number(c.r)
            << "\" fill=\"" << to_svg_color(c.fill) << "\"";
        if (c.opacity < 1.0) {
            out << " fill-opacity=\"" << format_number(c.opacity) << "\"";
        }
        out << "/>\n";
    }

    out << "</svg>\n";
    return out.str();
}
