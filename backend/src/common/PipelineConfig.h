#ifndef LIDARMAP_BACKEND_COMMON_PIPELINE_CONFIG_H
#define LIDARMAP_BACKEND_COMMON_PIPELINE_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "common/DataTypes.h"

namespace spdlog { class logger; }

namespace lidarmap::backend::common {

// Operator-facing tuning of the acquisition pipeline.
struct PipelineConfig {
	FilterConfig filter{};
	std::size_t store_capacity = 150000;
	uint32_t decimation_factor = 3;           // recompute every Nth merged batch
	uint32_t consecutive_error_threshold = 3; // frame read failures before aborting a scan
	std::chrono::milliseconds tick_interval{50};
	std::chrono::milliseconds join_timeout{2000};
	std::size_t channel_capacity = 1024;      // queued batches before the producer drops
};

// Accepted ranges for values coming from the environment or the command line.
namespace config_limits {
constexpr double kMinDistanceMm = 1000.0;
constexpr double kMaxDistanceMm = 16000.0;
constexpr std::size_t kMinStoreCapacity = 2000;
constexpr std::size_t kMaxStoreCapacity = 150000;
constexpr int64_t kMinTickMs = 1;
constexpr int64_t kMaxTickMs = 1000;
}

// Clamp every field into its accepted range. Each adjustment is logged as a warning.
PipelineConfig sanitizePipelineConfig(PipelineConfig cfg, const std::shared_ptr<spdlog::logger>& log);

// Apply LIDARMAP_* environment overrides on top of `base`, then sanitize:
//   LIDARMAP_MAX_DISTANCE_MM, LIDARMAP_MIN_QUALITY, LIDARMAP_STORE_CAPACITY,
//   LIDARMAP_DECIMATION, LIDARMAP_ERROR_THRESHOLD, LIDARMAP_TICK_MS,
//   LIDARMAP_JOIN_TIMEOUT_MS, LIDARMAP_CHANNEL_CAPACITY
// Unparsable values are ignored with a warning.
PipelineConfig loadPipelineConfig(PipelineConfig base, const std::shared_ptr<spdlog::logger>& log);

} // namespace lidarmap::backend::common

#endif // LIDARMAP_BACKEND_COMMON_PIPELINE_CONFIG_H
