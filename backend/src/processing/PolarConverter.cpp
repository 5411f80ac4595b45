#include "processing/PolarConverter.h"

#include <cmath>

namespace lidarmap::backend::processing {

namespace {
constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

inline bool passes(uint32_t quality, double distance, const FilterConfig& cfg) {
    return distance > 0.0 && quality > 0 && quality >= cfg.min_quality && distance <= cfg.max_distance_mm;
}
}

std::optional<Point> convert(const Measurement& m, const FilterConfig& cfg) {
    if (!passes(m.quality, m.distance_mm, cfg)) return std::nullopt;
    const double rad = m.angle_deg * kDegToRad;
    return Point(m.distance_mm * std::cos(rad), m.distance_mm * std::sin(rad), m.quality, m.distance_mm);
}

bool accepts(const Point& p, const FilterConfig& cfg) {
    return passes(p.quality, p.distance_mm, cfg);
}

std::vector<Point> refilter(const std::vector<Point>& points, const FilterConfig& cfg) {
    std::vector<Point> out;
    out.reserve(points.size());
    for (const auto& p : points) {
        if (accepts(p, cfg)) out.push_back(p);
    }
    return out;
}

} // namespace lidarmap::backend::processing
