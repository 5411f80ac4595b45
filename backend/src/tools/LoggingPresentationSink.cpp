#include "tools/LoggingPresentationSink.h"

#include <spdlog/logger.h>

#include "common/StatsUtil.h"

namespace lidarmap::backend::tools {

LoggingPresentationSink::LoggingPresentationSink(std::shared_ptr<spdlog::logger> logger,
                                                 std::chrono::milliseconds reportEvery)
    : logger_(std::move(logger)), reportEvery_(reportEvery) {}

void LoggingPresentationSink::onBatchMerged(const pipeline::PointSnapshot& view,
                                            const std::optional<processing::RoomMetrics>& metrics) {
    updates_.fetch_add(1);
    const auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(reportMutex_);
        if (now - lastReport_ < reportEvery_) return;
        lastReport_ = now;
    }

    const auto bounds = processing::computeViewBounds(*view);
    if (metrics) {
        logger_->info("View: {} pts | room {:.2f} x {:.2f} m, area {:.2f} m2, perimeter {:.2f} m, centre ({:.0f}, {:.0f}) mm",
                      view->size(), metrics->width / 1000.0, metrics->height / 1000.0, metrics->area_m2,
                      metrics->perimeter / 1000.0, metrics->centroid_x, metrics->centroid_y);
    } else {
        logger_->info("View: {} pts | collecting data (metrics from {} points)", view->size(),
                      processing::kMinMetricSamples);
    }
    logger_->debug("View bounds x=[{:.0f}, {:.0f}] y=[{:.0f}, {:.0f}] payload={}", bounds.min_x, bounds.max_x,
                   bounds.min_y, bounds.max_y, common::prettyBytes(view->size() * sizeof(common::Point)));
}

void LoggingPresentationSink::onFault(common::FaultKind kind, const std::string& description) {
    faults_.fetch_add(1);
    logger_->error("[{}] {}", common::toString(kind), description);
}

void LoggingPresentationSink::onStateChanged(pipeline::PipelineState state) {
    logger_->info("Status: {}", pipeline::toString(state));
}

} // namespace lidarmap::backend::tools
