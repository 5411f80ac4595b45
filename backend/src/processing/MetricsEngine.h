#ifndef LIDARMAP_BACKEND_PROCESSING_METRICS_ENGINE_H
#define LIDARMAP_BACKEND_PROCESSING_METRICS_ENGINE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "common/DataTypes.h"

namespace lidarmap::backend::processing {

// Below this many points no room metrics are reported.
constexpr std::size_t kMinMetricSamples = 100;

// Axis-aligned extents of the stored cloud. Lengths in mm, area in m^2.
struct RoomMetrics {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;
    double width = 0.0;      // max_x - min_x
    double height = 0.0;     // max_y - min_y
    double area_m2 = 0.0;    // width * height / 1e6
    double perimeter = 0.0;  // 2 * (width + height)
    double centroid_x = 0.0; // bounding box centre
    double centroid_y = 0.0;
    std::size_t point_count = 0;
};

// Single linear pass; std::nullopt when fewer than kMinMetricSamples points.
std::optional<RoomMetrics> computeRoomMetrics(const std::vector<common::Point>& points);

// Display extents for "fit to data": data range padded by 10% of the largest side
// (never less than 1 m). Fewer than kMinFitPoints points give the default +/-5 m view.
struct ViewBounds {
    double min_x = -5000.0;
    double max_x = 5000.0;
    double min_y = -5000.0;
    double max_y = 5000.0;
};
constexpr std::size_t kMinFitPoints = 11;
ViewBounds computeViewBounds(const std::vector<common::Point>& points);

// Acquisition session figures as shown next to the live view.
struct SessionStats {
    uint64_t scans_processed = 0;  // merged batches
    std::size_t total_points = 0;  // current store size
    uint64_t points_received = 0;  // all points merged, including evicted ones
    double duration_s = 0.0;
    double points_per_second = 0.0;
    std::size_t memory_bytes = 0;  // store payload
};

} // namespace lidarmap::backend::processing

#endif // LIDARMAP_BACKEND_PROCESSING_METRICS_ENGINE_H
