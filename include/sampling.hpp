#pragma once

#include "config.hpp"
#include "image.hpp"
#include "lattice.hpp"
#include "mapper.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

struct SamplingResult {
    std::vector<CircleDescriptor> circles;  // lattice order
    size_t points = 0;
    size_t skipped = 0;  // points that produced no circle
};

/// Sample and map one point; nullopt if the point yields no circle.
/// Throws if the point computation fails.
std::optional<CircleDescriptor> sample_point(const RgbaImage& image,
                                             const SamplePoint& point,
                                             const CircleArtConfig& config);

/// Number of worker threads used for `requested` workers and `point_count` points
unsigned resolve_worker_count(int requested, size_t point_count);

/// Per-point work run by gather_circles
using PointSampler = std::function<std::optional<CircleDescriptor>(const SamplePoint&)>;

/// Run `sampler` over every point across `workers` threads and collect the
/// circles in lattice order. A point whose sampler throws is logged and skipped.
SamplingResult gather_circles(const std::vector<SamplePoint>& points,
                              int workers,
                              const PointSampler& sampler);

/// Sample every point across `workers` threads (0 = hardware concurrency).
/// The result does not depend on the worker count.
SamplingResult sample_circles(const RgbaImage& image,
                              const std::vector<SamplePoint>& points,
                              const CircleArtConfig& config,
                              int workers = 0);
