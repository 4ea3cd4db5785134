#include "sampling.hpp"
#include "test_util.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

static RgbaImage make_pattern(int w, int h) {
    RgbaImage img(w, h, Rgba{0, 0, 0, 255});
    uint32_t state = 12345;
    for (int y = 0; y < h; y++) {
        for (int x = 0; x < w; x++) {
            state = state * 1103515245u + 12345u;
            img.set(x, y, Rgba{(uint8_t)(state >> 16), (uint8_t)(state >> 8), (uint8_t)(x * 4 + y), 255});
        }
    }
    return img;
}

static CircleArtConfig make_config(SamplingMode sampling, RenderMode render) {
    CircleArtOptions o;
    o.circle_diameter = 5.0;
    o.circle_spacing = 1.0;
    o.sampling_mode = sampling;
    o.render_mode = render;
    if (render != RenderMode::Color) {
        o.min_dot_size = 0.0;
        o.max_dot_size = 2.5;
    }
    return CircleArtConfig::from_options(o);
}

static bool same_circles(const std::vector<CircleDescriptor>& a, const std::vector<CircleDescriptor>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (a[i].index != b[i].index || a[i].cx != b[i].cx || a[i].cy != b[i].cy ||
            a[i].radius != b[i].radius || a[i].fill != b[i].fill || a[i].opacity != b[i].opacity) {
            return false;
        }
    }
    return true;
}

static void testWorkerCountInvariant() {
    RgbaImage img = make_pattern(97, 64);
    const SamplingMode samplings[] = {SamplingMode::Grid, SamplingMode::Hexagonal};
    const RenderMode renders[] = {RenderMode::Color, RenderMode::HalftoneBlackOnWhite,
                                  RenderMode::HalftoneWhiteOnBlack};

    for (auto sampling : samplings) {
        for (auto render : renders) {
            auto config = make_config(sampling, render);
            auto points = generate_lattice(img.width(), img.height(), config);
            auto sequential = sample_circles(img, points, config, 1);
            ASSERT_TRUE(!sequential.circles.empty(), "sequential run produced circles");

            for (int workers : {2, 3, 7, 16, 0}) {
                auto parallel = sample_circles(img, points, config, workers);
                ASSERT_TRUE(same_circles(sequential.circles, parallel.circles),
                            "parallel result equals sequential result");
                ASSERT_EQ(parallel.skipped, sequential.skipped, "same skipped count");
                ASSERT_EQ(parallel.points, points.size(), "point count reported");
            }
        }
    }
}

static void testLatticeOrder() {
    RgbaImage img = make_pattern(60, 60);
    auto config = make_config(SamplingMode::Hexagonal, RenderMode::Color);
    auto points = generate_lattice(img.width(), img.height(), config);

    // Hand the points over back to front; output must still follow the lattice
    std::vector<SamplePoint> reversed(points.rbegin(), points.rend());
    auto result = sample_circles(img, reversed, config, 4);
    ASSERT_EQ(result.circles.size(), points.size(), "every point produced a circle");
    for (size_t i = 0; i < result.circles.size(); i++) {
        ASSERT_EQ(result.circles[i].index, i, "circles sorted by lattice index");
    }
}

static void testSkippedPoints() {
    RgbaImage img(20, 20, Rgba{255, 0, 0, 255});
    auto config = make_config(SamplingMode::Grid, RenderMode::Color);

    std::vector<SamplePoint> points = {
        {3.0, 3.0, 0, 0, 0},
        {-50.0, -50.0, 0, 1, 1},  // disc entirely outside the image
        {9.0, 3.0, 0, 2, 2},
    };
    auto result = sample_circles(img, points, config, 2);
    ASSERT_EQ(result.points, (size_t)3, "three points submitted");
    ASSERT_EQ(result.skipped, (size_t)1, "outside point skipped");
    ASSERT_EQ(result.circles.size(), (size_t)2, "remaining points rendered");
    if (result.circles.size() == 2) {
        ASSERT_EQ(result.circles[0].index, (size_t)0, "first kept");
        ASSERT_EQ(result.circles[1].index, (size_t)2, "third kept");
    }

    auto empty = sample_circles(img, {}, config, 4);
    ASSERT_TRUE(empty.circles.empty() && empty.skipped == 0, "no points, no circles");
}

static void testSolidRed() {
    RgbaImage img(37, 29, Rgba{255, 0, 0, 255});
    auto config = make_config(SamplingMode::Hexagonal, RenderMode::Color);
    auto points = generate_lattice(img.width(), img.height(), config);
    auto result = sample_circles(img, points, config, 3);

    ASSERT_EQ(result.circles.size(), points.size(), "one circle per point");
    for (const auto& c : result.circles) {
        ASSERT_TRUE(c.fill == (Color{255, 0, 0}), "pure red fill");
        ASSERT_NEAR(c.radius, 2.5, 1e-12, "radius = diameter / 2");
    }
}

static void testFailingPointSkipped() {
    std::vector<SamplePoint> points;
    for (size_t i = 0; i < 10; i++) {
        points.push_back({(double)i, 0.0, 0, (int)i, i});
    }

    std::vector<std::string> errors;
    set_log_sinks(nullptr, [&](std::string_view m) { errors.emplace_back(m); });

    auto result = gather_circles(points, 3, [](const SamplePoint& p) -> std::optional<CircleDescriptor> {
        if (p.index == 4) {
            throw std::runtime_error("corrupt pixel row");
        }
        return CircleDescriptor{p.index, p.x, p.y, 1.0, COLOR_BLACK, 1.0};
    });

    reset_log_sinks();

    ASSERT_EQ(result.points, (size_t)10, "all points attempted");
    ASSERT_EQ(result.skipped, (size_t)1, "failing point skipped");
    ASSERT_EQ(result.circles.size(), (size_t)9, "other points still rendered");
    for (const auto& c : result.circles) {
        ASSERT_TRUE(c.index != 4, "failed point absent");
    }
    ASSERT_EQ(errors.size(), (size_t)1, "failure logged once");
    if (!errors.empty()) {
        ASSERT_TRUE(errors[0].find("corrupt pixel row") != std::string::npos, "log names the cause");
    }
}

static void testResolveWorkers() {
    ASSERT_EQ(resolve_worker_count(4, 2), 2u, "never more threads than points");
    ASSERT_EQ(resolve_worker_count(3, 0), 1u, "at least one thread");
    ASSERT_EQ(resolve_worker_count(5, 100), 5u, "explicit count honoured");
    ASSERT_TRUE(resolve_worker_count(0, 1000) >= 1u, "hardware concurrency fallback");
}

int main() {
    testWorkerCountInvariant();
    testLatticeOrder();
    testSkippedPoints();
    testSolidRed();
    testFailingPointSkipped();
    testResolveWorkers();
    return finish_tests("Sampling");
}
