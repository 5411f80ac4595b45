#ifndef LIDARMAP_BACKEND_PIPELINE_IPRESENTATION_SINK_H
#define LIDARMAP_BACKEND_PIPELINE_IPRESENTATION_SINK_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/DataTypes.h"
#include "common/Faults.h"
#include "pipeline/PipelineState.h"
#include "processing/MetricsEngine.h"

namespace lidarmap::backend::pipeline {

// Immutable view handed to readers; never mutated after publication.
using PointSnapshot = std::shared_ptr<const std::vector<common::Point>>;

// Receives pipeline output for display. Callbacks arrive on the scheduler thread
// (onStateChanged also on the caller of start/stop) and must return quickly.
// Implementations must not call back into LifecycleController::startConnect/stop.
class IPresentationSink {
public:
    virtual ~IPresentationSink() = default;

    virtual void onBatchMerged(const PointSnapshot& view,
                               const std::optional<processing::RoomMetrics>& metrics) = 0;
    virtual void onFault(common::FaultKind kind, const std::string& description) = 0;
    virtual void onStateChanged(PipelineState state) = 0;
};

} // namespace lidarmap::backend::pipeline

#endif // LIDARMAP_BACKEND_PIPELINE_IPRESENTATION_SINK_H
