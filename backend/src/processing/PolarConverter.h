#ifndef LIDARMAP_BACKEND_PROCESSING_POLAR_CONVERTER_H
#define LIDARMAP_BACKEND_PROCESSING_POLAR_CONVERTER_H

#include <optional>
#include <vector>

#include "common/DataTypes.h"

namespace lidarmap::backend::processing {

using lidarmap::backend::common::FilterConfig;
using lidarmap::backend::common::Measurement;
using lidarmap::backend::common::Point;

// Polar measurement -> Cartesian point in the sensor frame, or std::nullopt when the
// measurement is rejected (distance <= 0, quality 0 or below min_quality, distance beyond
// max_distance_mm). Angles are passed to the trig functions as given.
std::optional<Point> convert(const Measurement& m, const FilterConfig& cfg);

// Same acceptance rule applied to an already converted point. Idempotent: a point produced
// by convert() under `cfg` is always accepted again under `cfg`.
bool accepts(const Point& p, const FilterConfig& cfg);

// Retroactive view of stored history under a (possibly changed) filter; order preserved.
std::vector<Point> refilter(const std::vector<Point>& points, const FilterConfig& cfg);

} // namespace lidarmap::backend::processing

#endif // LIDARMAP_BACKEND_PROCESSING_POLAR_CONVERTER_H
