#include "sampler.hpp"

#include <algorithm>
#include <cmath>

std::optional<AveragedSample> sample_disc(const RgbaImage& image, double x, double y, double radius) {
    if (image.empty() || !(radius >= 0.0) || !std::isfinite(x) || !std::isfinite(y)) {
        return std::nullopt;
    }
    if (x + radius < 0.0 || y + radius < 0.0 ||
        x - radius > image.width() || y - radius > image.height()) {
        return std::nullopt;
    }

    // Candidate pixel window, clamped to the image
    int x_start = std::max(0, (int)std::floor(x - radius - 0.5));
    int x_end = std::min(image.width() - 1, (int)std::ceil(x + radius - 0.5));
    int y_start = std::max(0, (int)std::floor(y - radius - 0.5));
    int y_end = std::min(image.height() - 1, (int)std::ceil(y + radius - 0.5));

    // Integer sums keep the mean independent of traversal order
    uint64_t r_sum = 0, g_sum = 0, b_sum = 0, a_sum = 0;
    size_t count = 0;
    const double r2 = radius * radius;

    for (int py = y_start; py <= y_end; py++) {
        double dy = py + 0.5 - y;
        for (int px = x_start; px <= x_end; px++) {
            double dx = px + 0.5 - x;
            if (dx * dx + dy * dy > r2) continue;

            Rgba p = image.at(px, py);
            r_sum += p.r;
            g_sum += p.g;
            b_sum += p.b;
            a_sum += p.a;
            count++;
        }
    }

    if (count == 0) {
        return std::nullopt;
    }

    double n = (double)count;
    return AveragedSample{r_sum / n, g_sum / n, b_sum / n, a_sum / n, count};
}
