#ifndef LIDARMAP_BACKEND_PROCESSING_FRAME_PROCESSOR_H
#define LIDARMAP_BACKEND_PROCESSING_FRAME_PROCESSOR_H

#include <cstdint>
#include <memory>

#include "common/DataTypes.h"

namespace spdlog { class logger; }

namespace lidarmap::backend::processing {

// Turns one scan frame into one batch of accepted points (single pass, measurement order).
class FrameProcessor {
public:
    using ScanFrame = lidarmap::backend::common::ScanFrame;
    using Batch = lidarmap::backend::common::Batch;
    using FilterConfig = lidarmap::backend::common::FilterConfig;

    struct FrameSummary {
        uint32_t accepted = 0;
        uint32_t rejected = 0;
    };

    explicit FrameProcessor(std::shared_ptr<spdlog::logger> logger = nullptr);

    // An all-rejected frame yields an empty batch; callers decide whether to forward it.
    Batch process(const ScanFrame& frame, const FilterConfig& cfg);

    const FrameSummary& lastSummary() const { return lastSummary_; }
    uint64_t framesProcessed() const { return frameCounter_; }
    uint64_t pointsAccepted() const { return acceptedTotal_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
    FrameSummary lastSummary_{};
    uint64_t frameCounter_ = 0;
    uint64_t acceptedTotal_ = 0;
};

} // namespace lidarmap::backend::processing

#endif // LIDARMAP_BACKEND_PROCESSING_FRAME_PROCESSOR_H
