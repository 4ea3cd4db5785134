#include "color.hpp"

#include <cctype>
#include <map>
#include <sstream>
#include <stdexcept>

static const std::map<std::string, Color> NAMED_COLORS = {
    {"black",   {0, 0, 0}},
    {"white",   {255, 255, 255}},
    {"red",     {255, 0, 0}},
    {"lime",    {0, 255, 0}},
    {"green",   {0, 128, 0}},
    {"blue",    {0, 0, 255}},
    {"yellow",  {255, 255, 0}},
    {"cyan",    {0, 255, 255}},
    {"magenta", {255, 0, 255}},
    {"gray",    {128, 128, 128}},
    {"grey",    {128, 128, 128}},
    {"silver",  {192, 192, 192}},
    {"maroon",  {128, 0, 0}},
    {"navy",    {0, 0, 128}},
    {"olive",   {128, 128, 0}},
    {"purple",  {128, 0, 128}},
    {"teal",    {0, 128, 128}},
    {"orange",  {255, 165, 0}},
};

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

static std::optional<Color> parse_hex(const std::string& hex) {
    if (hex.size() != 3 && hex.size() != 6) return std::nullopt;

    int v[6];
    for (size_t i = 0; i < hex.size(); i++) {
        v[i] = hex_digit(hex[i]);
        if (v[i] < 0) return std::nullopt;
    }

    if (hex.size() == 3) {
        return Color{v[0] * 17, v[1] * 17, v[2] * 17};
    }
    return Color{v[0] * 16 + v[1], v[2] * 16 + v[3], v[4] * 16 + v[5]};
}

static std::optional<Color> parse_rgb_function(const std::string& text) {
    if (text.compare(0, 4, "rgb(") != 0 || text.back() != ')') return std::nullopt;

    std::istringstream iss(text.substr(4, text.size() - 5));
    int c[3];
    for (int i = 0; i < 3; i++) {
        if (!(iss >> c[i]) || c[i] < 0 || c[i] > 255) return std::nullopt;
        if (i < 2) {
            char comma = 0;
            if (!(iss >> comma) || comma != ',') return std::nullopt;
        }
    }
    iss >> std::ws;
    if (!iss.eof()) return std::nullopt;

    return Color{c[0], c[1], c[2]};
}

std::optional<Color> parse_color(const std::string& text) {
    std::string s;
    for (char c : text) {
        if (!std::isspace((unsigned char)c)) {
            s.push_back((char)std::tolower((unsigned char)c));
        }
    }

    if (s == "none") return std::nullopt;

    std::optional<Color> color;
    if (!s.empty() && s[0] == '#') {
        color = parse_hex(s.substr(1));
    } else if (!s.empty() && s.back() == ')') {
        color = parse_rgb_function(s);
    } else {
        auto it = NAMED_COLORS.find(s);
        if (it != NAMED_COLORS.end()) color = it->second;
    }

    if (!color) {
        throw std::invalid_argument("Unknown color: " + text);
    }
    return color;
}

std::string to_svg_color(const Color& color) {
    if (color == COLOR_BLACK) return "black";
    if (color == COLOR_WHITE) return "white";

    std::ostringstream oss;
    oss << "rgb(" << color.r << "," << color.g << "," << color.b << ")";
    return oss.str();
}
