#include "SyntheticSensorDriver.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <thread>

using namespace std::chrono_literals;
namespace lidarmap::backend::hal {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

SyntheticSensorDriver::SyntheticSensorDriver(const Config& cfg, std::shared_ptr<spdlog::logger> log)
    : cfg_(cfg), log_(std::move(log)), rng_(cfg.seed) {}

DeviceInfo SyntheticSensorDriver::connect(const std::string& port) {
    FaultInjectionConfig fic;
    {
        std::lock_guard<std::mutex> lock(faultMutex_);
        fic = faults_;
    }
    if (port.empty()) {
        throw ConnectError("no port given");
    }
    if (fic.rejectConnect) {
        throw ConnectError("no sensor answering on " + port);
    }
    rng_.seed(cfg_.seed);
    reads_ = 0;
    measurementCounter_ = 0;
    delivered_.store(0);
    failed_.store(0);
    dropouts_.store(0);
    next_tp_ = std::chrono::steady_clock::now();
    connected_.store(true);
    streaming_.store(true);
    if (log_) log_->info("SyntheticSensorDriver connected id={} port={} pattern={} fps={}",
                         cfg_.sensorId, port, cfg_.pattern == Pattern::RECTANGLE ? "rectangle" : "circle", cfg_.fps);
    DeviceInfo info;
    info.model = "synthetic-" + std::string(cfg_.pattern == Pattern::RECTANGLE ? "rect" : "circle");
    info.firmware = "1.0";
    info.hardware = "0";
    info.serial = cfg_.sensorId;
    return info;
}

HealthStatus SyntheticSensorDriver::getHealth() {
    if (!connected_.load()) throw DriverError("health requested while disconnected");
    std::lock_guard<std::mutex> lock(faultMutex_);
    HealthStatus h;
    h.state = faults_.health;
    h.error_code = faults_.health == common::HealthState::Good ? 0 : 0x8000;
    return h;
}

std::optional<ScanFrame> SyntheticSensorDriver::readFrame() {
    if (!connected_.load()) throw DriverError("read on a disconnected sensor");
    if (!streaming_.load()) return std::nullopt;

    FaultInjectionConfig fic;
    {
        std::lock_guard<std::mutex> lock(faultMutex_);
        fic = faults_;
    }
    const uint64_t delivered = delivered_.load();
    if (fic.endAfter > 0 && delivered >= fic.endAfter) {
        streaming_.store(false);
        if (log_) log_->info("SyntheticSensorDriver end of stream after {} frames", delivered);
        return std::nullopt;
    }
    if (fic.failAfter > 0 && delivered >= fic.failAfter) {
        throw DriverError("synthetic sensor lost motor sync");
    }

    pace();
    if (fic.jitterMaxMs > 0) {
        std::uniform_int_distribution<uint32_t> dist(0, fic.jitterMaxMs);
        if (uint32_t extra = dist(rng_)) std::this_thread::sleep_for(std::chrono::milliseconds(extra));
    }

    ++reads_;
    if (fic.failEveryN > 0 && reads_ % fic.failEveryN == 0) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        if (log_ && log_->should_log(spdlog::level::debug)) {
            log_->debug("(fault) frame read error injected read={} failEveryN={}", reads_, fic.failEveryN);
        }
        throw FrameReadError("descriptor checksum mismatch (injected)");
    }

    ScanFrame frame;
    frame.index = delivered;
    frame.measurements.reserve(static_cast<size_t>(std::max(cfg_.measurementsPerFrame, 0)));
    std::uniform_real_distribution<double> noise(-cfg_.noiseMm, cfg_.noiseMm);
    const int n = std::max(cfg_.measurementsPerFrame, 1);
    for (int i = 0; i < cfg_.measurementsPerFrame; ++i) {
        const double angle = 360.0 * static_cast<double>(i) / n;
        ++measurementCounter_;
        if (fic.dropoutEveryN > 0 && measurementCounter_ % fic.dropoutEveryN == 0) {
            frame.measurements.emplace_back(0u, angle, 0.0);
            dropouts_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        double d = rangeAt(angle);
        if (cfg_.noiseMm > 0.0) d = std::max(0.0, d + noise(rng_));
        frame.measurements.emplace_back(cfg_.quality, angle, d);
    }
    frame.timestamp_ns = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
    delivered_.fetch_add(1, std::memory_order_relaxed);
    return frame;
}

void SyntheticSensorDriver::stop() {
    if (streaming_.exchange(false) && log_) {
        log_->info("SyntheticSensorDriver stopped id={} delivered={}", cfg_.sensorId, delivered_.load());
    }
}

void SyntheticSensorDriver::disconnect() {
    streaming_.store(false);
    if (connected_.exchange(false) && log_) {
        log_->info("SyntheticSensorDriver disconnected id={}", cfg_.sensorId);
    }
}

void SyntheticSensorDriver::configureFaultInjection(const FaultInjectionConfig& fic) {
    {
        std::lock_guard<std::mutex> lock(faultMutex_);
        faults_ = fic;
    }
    if (log_) {
        log_->info("Configured fault injection failEveryN={} dropoutEveryN={} jitterMaxMs={} failAfter={} endAfter={} rejectConnect={}",
                   fic.failEveryN, fic.dropoutEveryN, fic.jitterMaxMs, fic.failAfter, fic.endAfter, fic.rejectConnect);
    }
}

double SyntheticSensorDriver::rangeAt(double angleDeg) const {
    if (cfg_.pattern == Pattern::CIRCLE) {
        return cfg_.circleRadiusMm;
    }
    // Walls relative to the sensor; the nearest positive hit along the ray wins
    const double xMin = -cfg_.roomWidthMm / 2.0 - cfg_.sensorXMm;
    const double xMax = cfg_.roomWidthMm / 2.0 - cfg_.sensorXMm;
    const double yMin = -cfg_.roomHeightMm / 2.0 - cfg_.sensorYMm;
    const double yMax = cfg_.roomHeightMm / 2.0 - cfg_.sensorYMm;
    const double rad = angleDeg * kPi / 180.0;
    const double c = std::cos(rad);
    const double s = std::sin(rad);
    constexpr double eps = 1e-12;
    double t = std::numeric_limits<double>::infinity();
    if (c > eps) t = std::min(t, xMax / c);
    else if (c < -eps) t = std::min(t, xMin / c);
    if (s > eps) t = std::min(t, yMax / s);
    else if (s < -eps) t = std::min(t, yMin / s);
    return std::isfinite(t) && t > 0.0 ? t : 0.0;
}

void SyntheticSensorDriver::pace() {
    using clock = std::chrono::steady_clock;
    if (cfg_.fps <= 0.0) return;
    const auto period = std::chrono::duration_cast<clock::duration>(std::chrono::duration<double>(1.0 / cfg_.fps));
    next_tp_ += period;
    const auto now = clock::now();
    if (next_tp_ < now - period) {
        next_tp_ = now; // fell behind (debugger, slow consumer); do not burst
        return;
    }
    std::this_thread::sleep_until(next_tp_);
}

} // namespace lidarmap::backend::hal
