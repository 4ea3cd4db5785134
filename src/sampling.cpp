#include "sampling.hpp"
#include "log.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <thread>

std::optional<CircleDescriptor> sample_point(const RgbaImage& image,
                                             const SamplePoint& point,
                                             const CircleArtConfig& config) {
    auto sample = sample_disc(image, point.x, point.y, config.sample_radius());
    if (!sample) {
        return std::nullopt;
    }
    return map_sample(*sample, point, config);
}

unsigned resolve_worker_count(int requested, size_t point_count) {
    unsigned count = requested > 0 ? (unsigned)requested : std::thread::hardware_concurrency();
    if (count == 0) count = 1;
    if (point_count < count) count = (unsigned)std::max<size_t>(point_count, 1);
    return count;
}

SamplingResult gather_circles(const std::vector<SamplePoint>& points,
                              int workers,
                              const PointSampler& sampler) {
    SamplingResult result;
    result.points = points.size();
    if (points.empty()) {
        return result;
    }

    // One slot per point; each worker only touches the slots of its own chunk
    std::vector<std::optional<CircleDescriptor>> slots(points.size());

    auto run_chunk = [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; i++) {
            try {
                slots[i] = sampler(points[i]);
            } catch (const std::exception& e) {
                log_errorf("Skipping sample ", points[i].index, " at (", points[i].x, ", ",
                           points[i].y, "): ", e.what(), "\n");
                slots[i].reset();
            }
        }
    };

    unsigned thread_count = resolve_worker_count(workers, points.size());
    size_t chunk = (points.size() + thread_count - 1) / thread_count;

    if (thread_count == 1) {
        run_chunk(0, points.size());
    } else {
        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (size_t begin = 0; begin < points.size(); begin += chunk) {
            size_t end = std::min(begin + chunk, points.size());
            threads.emplace_back(run_chunk, begin, end);
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    result.circles.reserve(points.size());
    for (auto& slot : slots) {
        if (slot) {
            result.circles.push_back(*slot);
        } else {
            result.skipped++;
        }
    }

    // Slots follow the input order; restore lattice order in case the caller reordered points
    std::stable_sort(result.circles.begin(), result.circles.end(),
                     [](const CircleDescriptor& a, const CircleDescriptor& b) {
                         return a.index < b.index;
                     });

    return result;
}

SamplingResult sample_circles(const RgbaImage& image,
                              const std::vector<SamplePoint>& points,
                              const CircleArtConfig& config,
                              int workers) {
    return gather_circles(points, workers, [&](const SamplePoint& point) {
        return sample_point(image, point, config);
    });
}
