#ifndef LIDARMAP_BACKEND_PIPELINE_ACQUISITION_TASK_H
#define LIDARMAP_BACKEND_PIPELINE_ACQUISITION_TASK_H

#include <cstdint>
#include <memory>

namespace spdlog { class logger; }
namespace lidarmap::backend::hal { class ISensorDriver; }
namespace lidarmap::backend::processing { class FilterSettings; }

namespace lidarmap::backend::pipeline {

class BatchChannel;
class CancellationToken;

// Everything the producer touches. Shared ownership only, so a task that outlives
// its bounded join (detached) still works on valid objects.
struct AcquisitionContext {
    std::shared_ptr<hal::ISensorDriver> driver;
    std::shared_ptr<BatchChannel> channel;
    std::shared_ptr<processing::FilterSettings> filter;
    std::shared_ptr<CancellationToken> token;
    std::shared_ptr<spdlog::logger> logger;
    uint32_t consecutive_error_threshold = 3;
};

// Producer loop: read frame -> convert/filter -> send non-empty batch, until the token
// is cancelled or the stream fails. Ends by sending a Fault when
//   - consecutive_error_threshold FrameReadErrors occur back to back (FaultKind::Frame)
//   - the driver raises any other error or the stream ends (FaultKind::Channel)
// unless cancellation was already requested. A frame whose read returns after
// cancellation is discarded. Never throws.
void runAcquisition(AcquisitionContext ctx);

} // namespace lidarmap::backend::pipeline

#endif // LIDARMAP_BACKEND_PIPELINE_ACQUISITION_TASK_H
