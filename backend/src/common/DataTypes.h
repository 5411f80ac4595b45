// Core data contracts flowing from the sensor driver to the point store.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lidarmap::backend::common {

// One quality/angle/distance triple from a single sensor pulse.
struct Measurement {
	uint32_t quality = 0;
	double angle_deg = 0.0;   // sensor frame convention, not wrapped or validated
	double distance_mm = 0.0;

	Measurement() = default;
	Measurement(uint32_t q, double a, double d) : quality(q), angle_deg(a), distance_mm(d) {}
};

// One full rotation worth of measurements.
struct ScanFrame {
	uint64_t index = 0;        // monotonically increasing per driver session
	uint64_t timestamp_ns = 0; // steady clock at frame completion
	std::vector<Measurement> measurements;
};

// Accepted point in the sensor's own Cartesian frame. Never mutated once stored.
struct Point {
	double x_mm = 0.0;
	double y_mm = 0.0;
	uint32_t quality = 0;
	double distance_mm = 0.0;

	Point() = default;
	Point(double x, double y, uint32_t q, double d) : x_mm(x), y_mm(y), quality(q), distance_mm(d) {}
};

inline bool operator==(const Point& a, const Point& b) {
	return a.x_mm == b.x_mm && a.y_mm == b.y_mm && a.quality == b.quality && a.distance_mm == b.distance_mm;
}
inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }

// Accepted points of one scan frame, in measurement order.
struct Batch {
	uint64_t frame_index = 0;
	std::vector<Point> points;
};

struct FilterConfig {
	double max_distance_mm = 8000.0;
	uint32_t min_quality = 1; // quality 0 is always rejected
};

struct DeviceInfo {
	std::string model;
	std::string firmware;
	std::string hardware;
	std::string serial;
};

enum class HealthState { Good, Warning, Error };

struct HealthStatus {
	HealthState state = HealthState::Good;
	int error_code = 0;
};

inline const char* toString(HealthState s) {
	switch (s) {
		case HealthState::Good: return "Good";
		case HealthState::Warning: return "Warning";
		case HealthState::Error: return "Error";
	}
	return "Unknown";
}

} // namespace lidarmap::backend::common
