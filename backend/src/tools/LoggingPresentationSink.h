// Console stand-in for the live map window: reports merged views, metrics and state
// changes through a named logger.

#ifndef LIDARMAP_BACKEND_TOOLS_LOGGING_PRESENTATION_SINK_H
#define LIDARMAP_BACKEND_TOOLS_LOGGING_PRESENTATION_SINK_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

#include "pipeline/IPresentationSink.h"

namespace spdlog { class logger; }

namespace lidarmap::backend::tools {

class LoggingPresentationSink : public pipeline::IPresentationSink {
public:
    // Merged-view updates are logged at most once per `reportEvery`.
    explicit LoggingPresentationSink(std::shared_ptr<spdlog::logger> logger,
                                     std::chrono::milliseconds reportEvery = std::chrono::milliseconds(1000));

    void onBatchMerged(const pipeline::PointSnapshot& view,
                       const std::optional<processing::RoomMetrics>& metrics) override;
    void onFault(common::FaultKind kind, const std::string& description) override;
    void onStateChanged(pipeline::PipelineState state) override;

    uint64_t updates() const { return updates_.load(); }
    uint64_t faults() const { return faults_.load(); }

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::chrono::milliseconds reportEvery_;
    std::mutex reportMutex_;
    std::chrono::steady_clock::time_point lastReport_{};
    std::atomic<uint64_t> updates_{0};
    std::atomic<uint64_t> faults_{0};
};

} // namespace lidarmap::backend::tools

#endif // LIDARMAP_BACKEND_TOOLS_LOGGING_PRESENTATION_SINK_H
