#pragma once

#include <optional>
#include <string>

/// RGB color
struct Color {
    int r, g, b;
};

inline bool operator==(const Color& a, const Color& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const Color& a, const Color& b) {
    return !(a == b);
}

static const Color COLOR_BLACK = {0, 0, 0};
static const Color COLOR_WHITE = {255, 255, 255};

/// Resolve "#rgb", "#rrggbb", "rgb(r,g,b)" or a CSS color name.
/// "none" yields an empty optional. Throws std::invalid_argument otherwise.
std::optional<Color> parse_color(const std::string& text);

/// "black" / "white" for the two paper colors, "rgb(r,g,b)" for everything else
std::string to_svg_color(const Color& color);
