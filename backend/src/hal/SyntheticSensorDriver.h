// SyntheticSensorDriver.h
// Deterministic in-process range sensor: ray-casts a rectangular (or circular) room
// at a fixed rotation rate. Used by the backend demo mode and the integration tests.

#ifndef LIDARMAP_BACKEND_HAL_SYNTHETIC_SENSOR_DRIVER_H
#define LIDARMAP_BACKEND_HAL_SYNTHETIC_SENSOR_DRIVER_H

#include "hal/ISensorDriver.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <random>
#include <spdlog/spdlog.h>

namespace lidarmap::backend::hal {

class SyntheticSensorDriver : public ISensorDriver {
public:
    enum class Pattern { RECTANGLE, CIRCLE };
    struct Config {
        std::string sensorId = "Synthetic_0";
        Pattern pattern = Pattern::RECTANGLE;
        double roomWidthMm = 6000.0;   // RECTANGLE: wall-to-wall along x
        double roomHeightMm = 4000.0;  // RECTANGLE: wall-to-wall along y
        double sensorXMm = 0.0;        // sensor position relative to the room centre
        double sensorYMm = 0.0;
        double circleRadiusMm = 3000.0; // CIRCLE
        int measurementsPerFrame = 360;
        double fps = 10.0;
        uint32_t quality = 47;
        double noiseMm = 0.0;          // uniform +/- noise added to every distance
        uint32_t seed = 0xC0FFEE;
    };

    struct FaultInjectionConfig {
        uint32_t failEveryN = 0;     // throw FrameReadError on every Nth read if >0
        uint32_t dropoutEveryN = 0;  // zero distance/quality on every Nth measurement if >0
        uint32_t jitterMaxMs = 0;    // uniform extra delay [0,jitterMaxMs] per frame
        uint64_t failAfter = 0;      // unrecoverable DriverError once this many frames were delivered
        uint64_t endAfter = 0;       // end of stream once this many frames were delivered
        bool rejectConnect = false;
        common::HealthState health = common::HealthState::Good;
    };

    struct Stats { uint64_t delivered = 0; uint64_t failed = 0; uint64_t dropouts = 0; };

    SyntheticSensorDriver(const Config& cfg, std::shared_ptr<spdlog::logger> log);
    ~SyntheticSensorDriver() override = default;

    DeviceInfo connect(const std::string& port) override;
    HealthStatus getHealth() override;
    std::optional<ScanFrame> readFrame() override;
    void stop() override;
    void disconnect() override;
    std::string getDeviceID() const override { return cfg_.sensorId; }

    void configureFaultInjection(const FaultInjectionConfig& fic);
    Stats stats() const { return Stats{delivered_.load(), failed_.load(), dropouts_.load()}; }
    bool isStreaming() const { return streaming_.load(); }

    // Range along a ray leaving the sensor at `angleDeg`, before noise.
    double rangeAt(double angleDeg) const;

private:
    void pace();

    Config cfg_{};
    std::shared_ptr<spdlog::logger> log_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> streaming_{false};

    std::mutex faultMutex_;
    FaultInjectionConfig faults_{};

    std::mt19937 rng_;
    std::chrono::steady_clock::time_point next_tp_{};
    uint64_t reads_ = 0;
    uint64_t measurementCounter_ = 0;
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropouts_{0};
};

} // namespace lidarmap::backend::hal

#endif // LIDARMAP_BACKEND_HAL_SYNTHETIC_SENSOR_DRIVER_H
