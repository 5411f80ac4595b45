#include "common/PipelineConfig.h"

#include <spdlog/logger.h>

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace lidarmap::backend::common {

namespace {

std::optional<double> envDouble(const char* name, const std::shared_ptr<spdlog::logger>& log) {
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    try {
        size_t used = 0;
        double parsed = std::stod(v, &used);
        if (used == std::string(v).size()) return parsed;
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    if (log) log->warn("Ignoring invalid {}='{}'", name, v);
    return std::nullopt;
}

std::optional<int64_t> envInt(const char* name, const std::shared_ptr<spdlog::logger>& log) {
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    try {
        size_t used = 0;
        long long parsed = std::stoll(v, &used);
        if (used == std::string(v).size()) return static_cast<int64_t>(parsed);
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    if (log) log->warn("Ignoring invalid {}='{}'", name, v);
    return std::nullopt;
}

} // namespace

PipelineConfig sanitizePipelineConfig(PipelineConfig cfg, const std::shared_ptr<spdlog::logger>& log) {
    using namespace config_limits;
    auto warn = [&](const char* field, const std::string& from, const std::string& to) {
        if (log) log->warn("Config {}={} out of range, using {}", field, from, to);
    };

    const double dist = std::clamp(cfg.filter.max_distance_mm, kMinDistanceMm, kMaxDistanceMm);
    if (dist != cfg.filter.max_distance_mm) {
        warn("max_distance_mm", std::to_string(cfg.filter.max_distance_mm), std::to_string(dist));
        cfg.filter.max_distance_mm = dist;
    }
    if (cfg.filter.min_quality < 1) {
        warn("min_quality", "0", "1");
        cfg.filter.min_quality = 1;
    }
    const std::size_t cap = std::clamp(cfg.store_capacity, kMinStoreCapacity, kMaxStoreCapacity);
    if (cap != cfg.store_capacity) {
        warn("store_capacity", std::to_string(cfg.store_capacity), std::to_string(cap));
        cfg.store_capacity = cap;
    }
    if (cfg.decimation_factor < 1) {
        warn("decimation_factor", "0", "1");
        cfg.decimation_factor = 1;
    }
    if (cfg.consecutive_error_threshold < 1) {
        warn("consecutive_error_threshold", "0", "1");
        cfg.consecutive_error_threshold = 1;
    }
    const int64_t tick = std::clamp<int64_t>(cfg.tick_interval.count(), kMinTickMs, kMaxTickMs);
    if (tick != cfg.tick_interval.count()) {
        warn("tick_interval_ms", std::to_string(cfg.tick_interval.count()), std::to_string(tick));
        cfg.tick_interval = std::chrono::milliseconds(tick);
    }
    if (cfg.join_timeout.count() < 0) {
        warn("join_timeout_ms", std::to_string(cfg.join_timeout.count()), "0");
        cfg.join_timeout = std::chrono::milliseconds(0);
    }
    if (cfg.channel_capacity < 1) {
        warn("channel_capacity", "0", "1");
        cfg.channel_capacity = 1;
    }
    return cfg;
}

PipelineConfig loadPipelineConfig(PipelineConfig base, const std::shared_ptr<spdlog::logger>& log) {
    PipelineConfig cfg = base;
    auto applied = [&](const char* name, const std::string& value) {
        if (log) log->info("Applied {}={}", name, value);
    };
    // Negative integers map to 0 so sanitize reports them against the field minimum
    auto nonNegative = [](int64_t v) { return static_cast<uint64_t>(std::max<int64_t>(v, 0)); };

    if (auto v = envDouble("LIDARMAP_MAX_DISTANCE_MM", log)) {
        cfg.filter.max_distance_mm = *v; applied("LIDARMAP_MAX_DISTANCE_MM", std::to_string(*v));
    }
    if (auto v = envInt("LIDARMAP_MIN_QUALITY", log)) {
        cfg.filter.min_quality = static_cast<uint32_t>(nonNegative(*v)); applied("LIDARMAP_MIN_QUALITY", std::to_string(*v));
    }
    if (auto v = envInt("LIDARMAP_STORE_CAPACITY", log)) {
        cfg.store_capacity = static_cast<std::size_t>(nonNegative(*v)); applied("LIDARMAP_STORE_CAPACITY", std::to_string(*v));
    }
    if (auto v = envInt("LIDARMAP_DECIMATION", log)) {
        cfg.decimation_factor = static_cast<uint32_t>(nonNegative(*v)); applied("LIDARMAP_DECIMATION", std::to_string(*v));
    }
    if (auto v = envInt("LIDARMAP_ERROR_THRESHOLD", log)) {
        cfg.consecutive_error_threshold = static_cast<uint32_t>(nonNegative(*v)); applied("LIDARMAP_ERROR_THRESHOLD", std::to_string(*v));
    }
    if (auto v = envInt("LIDARMAP_TICK_MS", log)) {
        cfg.tick_interval = std::chrono::milliseconds(*v); applied("LIDARMAP_TICK_MS", std::to_string(*v));
    }
    if (auto v = envInt("LIDARMAP_JOIN_TIMEOUT_MS", log)) {
        cfg.join_timeout = std::chrono::milliseconds(*v); applied("LIDARMAP_JOIN_TIMEOUT_MS", std::to_string(*v));
    }
    if (auto v = envInt("LIDARMAP_CHANNEL_CAPACITY", log)) {
        cfg.channel_capacity = static_cast<std::size_t>(nonNegative(*v)); applied("LIDARMAP_CHANNEL_CAPACITY", std::to_string(*v));
    }
    return sanitizePipelineConfig(cfg, log);
}

} // namespace lidarmap::backend::common
