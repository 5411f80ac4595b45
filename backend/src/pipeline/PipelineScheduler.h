// PipelineScheduler.h
// Consumer side of the acquisition pipeline: drains the batch channel on a fixed cadence,
// merges batches into the point store and, every Nth merged batch, republishes the
// filtered presentation view together with fresh room metrics.

#ifndef LIDARMAP_BACKEND_PIPELINE_PIPELINE_SCHEDULER_H
#define LIDARMAP_BACKEND_PIPELINE_PIPELINE_SCHEDULER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "common/Faults.h"
#include "pipeline/IPresentationSink.h"
#include "processing/MetricsEngine.h"

namespace spdlog { class logger; }
namespace lidarmap::backend::store { class PointStore; }
namespace lidarmap::backend::processing { class FilterSettings; }

namespace lidarmap::backend::pipeline {

class BatchChannel;
class CancellationToken;

class PipelineScheduler {
public:
    struct Config {
        uint32_t decimation_factor = 3;
        std::chrono::milliseconds tick_interval{50};
    };

    // Invoked on the scheduler thread after a Fault message ended the loop.
    using FaultHandler = std::function<void(const common::FaultReport&)>;

    PipelineScheduler(Config cfg,
                      std::shared_ptr<BatchChannel> channel,
                      std::shared_ptr<store::PointStore> store,
                      std::shared_ptr<processing::FilterSettings> filter,
                      std::shared_ptr<IPresentationSink> sink,
                      std::shared_ptr<spdlog::logger> logger);
    ~PipelineScheduler();

    PipelineScheduler(const PipelineScheduler&) = delete;
    PipelineScheduler& operator=(const PipelineScheduler&) = delete;

    // Runs tick() every tick_interval until the token is cancelled or a Fault arrives.
    // The loop never calls finish(); the owner does once both tasks are down.
    void start(std::shared_ptr<CancellationToken> token, FaultHandler onFault);
    // Must not be called from the scheduler thread itself.
    void join();
    bool isRunning() const { return running_.load(); }

    // One drain/merge pass. Returns false when a Fault message was received; the
    // messages queued behind it are left untouched.
    bool tick();
    // Serves a pending clear, merges whatever Data is still queued and runs exactly one
    // forced recompute.
    void finish();
    // Snapshot + refilter + metrics + publish + notify.
    void recompute();

    // New session: counters zeroed, store cleared, clock restarted. Store mutation, so
    // only while the loop is not running.
    void resetSession(uint64_t scanCount = 0);
    // Swaps in the channel the next session's producer writes to. Only while the loop is
    // not running; anything still queued on the old channel is never read.
    void attachChannel(std::shared_ptr<BatchChannel> channel);
    // New session around contents loaded into the store from outside (file import).
    void adoptStore(uint64_t scanCount);
    // Empties the store. While the loop runs the request is served at the next tick.
    void clearStore();

    PointSnapshot latestSnapshot() const; // filtered presentation view
    PointSnapshot latestRaw() const;      // unfiltered store contents at the last recompute
    std::optional<processing::RoomMetrics> latestMetrics() const;
    processing::SessionStats sessionStats() const;

    uint64_t mergedBatches() const { return mergedBatches_.load(); }
    uint64_t recomputeCount() const { return recomputeCount_.load(); }
    std::optional<common::FaultReport> lastFault() const;

private:
    void runLoop(std::shared_ptr<CancellationToken> token, FaultHandler onFault);
    void merge(const common::Batch& batch);
    void clearContents();
    void updateStoreCounters();

    Config cfg_{};
    std::shared_ptr<BatchChannel> channel_;
    std::shared_ptr<store::PointStore> store_;
    std::shared_ptr<processing::FilterSettings> filter_;
    std::shared_ptr<IPresentationSink> sink_;
    std::shared_ptr<spdlog::logger> logger_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::shared_ptr<CancellationToken> token_;
    std::atomic<bool> clearRequested_{false};

    std::atomic<uint64_t> mergedBatches_{0};
    std::atomic<uint64_t> recomputeCount_{0};
    std::atomic<uint64_t> storeSize_{0};
    std::atomic<uint64_t> pointsReceived_{0};
    std::atomic<uint64_t> filterVersionSeen_{0};

    mutable std::mutex publishMutex_;
    PointSnapshot latestRaw_;
    PointSnapshot latestView_;
    std::optional<processing::RoomMetrics> latestMetrics_;
    std::optional<common::FaultReport> lastFault_;
    std::chrono::steady_clock::time_point sessionStart_;
    std::optional<std::chrono::steady_clock::time_point> sessionEnd_;
};

} // namespace lidarmap::backend::pipeline

#endif // LIDARMAP_BACKEND_PIPELINE_PIPELINE_SCHEDULER_H
