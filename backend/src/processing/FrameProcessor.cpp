#include "processing/FrameProcessor.h"

#include <spdlog/logger.h>

#include "processing/PolarConverter.h"

namespace lidarmap::backend::processing {

FrameProcessor::FrameProcessor(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

FrameProcessor::Batch FrameProcessor::process(const ScanFrame& frame, const FilterConfig& cfg) {
    Batch batch;
    batch.frame_index = frame.index;
    batch.points.reserve(frame.measurements.size());
    lastSummary_ = {};
    for (const auto& m : frame.measurements) {
        if (auto p = convert(m, cfg)) {
            batch.points.push_back(*p);
            ++lastSummary_.accepted;
        } else {
            ++lastSummary_.rejected;
        }
    }
    acceptedTotal_ += lastSummary_.accepted;
    if (logger_ && (frameCounter_ % 60) == 0) {
        logger_->debug("Frame {} accepted={} rejected={} (max_distance={} min_quality={})",
                       frame.index, lastSummary_.accepted, lastSummary_.rejected, cfg.max_distance_mm, cfg.min_quality);
    }
    ++frameCounter_;
    return batch;
}

} // namespace lidarmap::backend::processing
