#include "pipeline/AcquisitionTask.h"

#include <chrono>
#include <exception>
#include <string>

#include <spdlog/logger.h>

#include "common/Logger.h"
#include "hal/ISensorDriver.h"
#include "pipeline/BatchChannel.h"
#include "pipeline/CancellationToken.h"
#include "processing/FilterSettings.h"
#include "processing/FrameProcessor.h"

using namespace std::chrono_literals;

namespace lidarmap::backend::pipeline {

void runAcquisition(AcquisitionContext ctx) {
    auto& log = ctx.logger;
    const uint32_t threshold = ctx.consecutive_error_threshold == 0 ? 1 : ctx.consecutive_error_threshold;
    processing::FrameProcessor processor(log);
    uint32_t consecutiveErrors = 0;
    uint64_t batchesSent = 0;

    if (log) log->info("Acquisition started (device={} error_threshold={})", ctx.driver->getDeviceID(), threshold);

    while (!ctx.token->isCancelled()) {
        std::optional<common::ScanFrame> frame;
        try {
            frame = ctx.driver->readFrame();
        } catch (const hal::FrameReadError& ex) {
            ++consecutiveErrors;
            if (log) {
                // Rate limited via central Logger singleton (once per second)
                common::Logger::instance().warnRateLimited(log->name(), "frame_read_error", 1000ms,
                    fmt::format("Frame read failed ({}/{}): {}", consecutiveErrors, threshold, ex.what()));
            }
            if (consecutiveErrors >= threshold) {
                if (ctx.token->isCancelled()) break;
                std::string desc = std::to_string(consecutiveErrors) + " consecutive frame read errors, last: " + ex.what();
                if (log) log->error("Aborting acquisition: {}", desc);
                ctx.channel->sendFault(common::FaultKind::Frame, std::move(desc));
                return;
            }
            continue;
        } catch (const std::exception& ex) {
            if (ctx.token->isCancelled()) break;
            if (log) log->error("Unrecoverable driver error: {}", ex.what());
            ctx.channel->sendFault(common::FaultKind::Channel, std::string("driver error: ") + ex.what());
            return;
        }

        // A read that outlived stop() belongs to a session that is already over.
        if (ctx.token->isCancelled()) break;
        if (!frame) {
            if (log) log->warn("Sensor frame stream ended after {} batches", batchesSent);
            ctx.channel->sendFault(common::FaultKind::Channel, "sensor frame stream ended");
            return;
        }
        consecutiveErrors = 0;

        auto batch = processor.process(*frame, ctx.filter->get());
        if (batch.points.empty()) continue;
        if (ctx.channel->sendData(std::move(batch))) ++batchesSent;
    }

    if (log) log->info("Acquisition cancelled (frames={} batches={} accepted points={})",
                       processor.framesProcessed(), batchesSent, processor.pointsAccepted());
}

} // namespace lidarmap::backend::pipeline
