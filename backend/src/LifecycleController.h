// Orchestrator for the acquisition pipeline: owns the state machine, both pipeline
// tasks and the driver session.

#ifndef LIDARMAP_BACKEND_LIFECYCLE_CONTROLLER_H
#define LIDARMAP_BACKEND_LIFECYCLE_CONTROLLER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <spdlog/logger.h>

#include "common/DataTypes.h"
#include "common/Faults.h"
#include "common/PipelineConfig.h"
#include "io/InterchangeCodec.h"
#include "pipeline/IPresentationSink.h"
#include "pipeline/PipelineState.h"
#include "processing/MetricsEngine.h"

namespace lidarmap::backend::hal { class ISensorDriver; }
namespace lidarmap::backend::store { class PointStore; }
namespace lidarmap::backend::processing { class FilterSettings; }
namespace lidarmap::backend::pipeline {
class BatchChannel;
class CancellationToken;
class PipelineScheduler;
}

namespace lidarmap::backend {

class LifecycleController {
public:
    LifecycleController(std::shared_ptr<spdlog::logger> lifecycleLogger,
                        common::PipelineConfig cfg,
                        std::shared_ptr<hal::ISensorDriver> driver,
                        std::shared_ptr<pipeline::IPresentationSink> sink);
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    // Idle only. Connects, checks health, clears the previous session and starts both
    // tasks. On failure a Connect fault is reported and the controller is back in Idle.
    bool startConnect(const std::string& port);
    // Scanning only; blocks until Idle. No-op in any other state.
    void stop();

    pipeline::PipelineState state() const { return state_.load(); }
    bool waitForState(pipeline::PipelineState s, std::chrono::milliseconds timeout) const;
    std::optional<common::DeviceInfo> deviceInfo() const;

    // Applies to newly accepted points immediately and to the published view at the
    // next tick (right away when Idle).
    void setFilter(const common::FilterConfig& cfg);
    common::FilterConfig filter() const;

    // Idle or Scanning.
    bool clearData();

    pipeline::PointSnapshot snapshot() const;
    std::optional<processing::RoomMetrics> metrics() const;
    processing::SessionStats sessionStats() const;
    processing::ViewBounds viewBounds() const;
    uint64_t recomputeCount() const;

    // Idle only. All-or-nothing.
    io::ImportResult importFile(const std::string& path);
    bool exportFile(const std::string& path) const;
    bool writeReport(const std::string& path) const;

private:
    void setState(pipeline::PipelineState s);
    void reportFault(common::FaultKind kind, const std::string& description);
    void handleFault(const common::FaultReport& report);
    void startAcquisition();
    void joinAcquisition();
    // Waits up to join_timeout for a detached acquisition task to leave the driver.
    bool previousReaderExited();
    void teardownDriver();

    std::shared_ptr<spdlog::logger> lifecycleLogger_;
    common::PipelineConfig cfg_;
    std::shared_ptr<hal::ISensorDriver> driver_;
    std::shared_ptr<pipeline::IPresentationSink> sink_;

    std::shared_ptr<processing::FilterSettings> filter_;
    std::shared_ptr<store::PointStore> store_;
    std::shared_ptr<pipeline::BatchChannel> channel_;
    std::unique_ptr<pipeline::PipelineScheduler> scheduler_;
    io::InterchangeCodec codec_;
    std::shared_ptr<spdlog::logger> acquisitionLogger_;

    std::mutex mutex_; // serialises transitions (start/stop/fault/import/clear)
    std::atomic<pipeline::PipelineState> state_{pipeline::PipelineState::Idle};
    mutable std::mutex stateMutex_;
    mutable std::condition_variable stateCv_;

    std::shared_ptr<pipeline::CancellationToken> token_;
    std::thread acquisitionThread_;
    std::future<void> acquisitionDone_;
    std::optional<common::DeviceInfo> deviceInfo_;
};

} // namespace lidarmap::backend

#endif // LIDARMAP_BACKEND_LIFECYCLE_CONTROLLER_H
