#include "processing/MetricsEngine.h"

#include <algorithm>
#include <limits>

namespace lidarmap::backend::processing {

namespace {

struct Extents {
    double min_x = std::numeric_limits<double>::infinity();
    double min_y = std::numeric_limits<double>::infinity();
    double max_x = -std::numeric_limits<double>::infinity();
    double max_y = -std::numeric_limits<double>::infinity();
};

Extents extentsOf(const std::vector<common::Point>& points) {
    Extents e;
    for (const auto& p : points) {
        e.min_x = std::min(e.min_x, p.x_mm);
        e.max_x = std::max(e.max_x, p.x_mm);
        e.min_y = std::min(e.min_y, p.y_mm);
        e.max_y = std::max(e.max_y, p.y_mm);
    }
    return e;
}

} // namespace

std::optional<RoomMetrics> computeRoomMetrics(const std::vector<common::Point>& points) {
    if (points.size() < kMinMetricSamples) return std::nullopt;
    const Extents e = extentsOf(points);
    RoomMetrics m;
    m.min_x = e.min_x;
    m.min_y = e.min_y;
    m.max_x = e.max_x;
    m.max_y = e.max_y;
    m.width = e.max_x - e.min_x;
    m.height = e.max_y - e.min_y;
    m.area_m2 = m.width * m.height / 1'000'000.0;
    m.perimeter = 2.0 * (m.width + m.height);
    m.centroid_x = (e.max_x + e.min_x) / 2.0;
    m.centroid_y = (e.max_y + e.min_y) / 2.0;
    m.point_count = points.size();
    return m;
}

ViewBounds computeViewBounds(const std::vector<common::Point>& points) {
    ViewBounds v;
    if (points.size() < kMinFitPoints) return v;
    const Extents e = extentsOf(points);
    const double range = std::max({e.max_x - e.min_x, e.max_y - e.min_y, 1000.0});
    const double margin = range * 0.1;
    v.min_x = e.min_x - margin;
    v.max_x = e.max_x + margin;
    v.min_y = e.min_y - margin;
    v.max_y = e.max_y + margin;
    return v;
}

} // namespace lidarmap::backend::processing
