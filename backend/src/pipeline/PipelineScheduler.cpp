#include "pipeline/PipelineScheduler.h"

#include <stdexcept>

#include <spdlog/logger.h>

#include "pipeline/BatchChannel.h"
#include "pipeline/CancellationToken.h"
#include "processing/FilterSettings.h"
#include "processing/PolarConverter.h"
#include "store/PointStore.h"

namespace lidarmap::backend::pipeline {

using Clock = std::chrono::steady_clock;

PipelineScheduler::PipelineScheduler(Config cfg,
                                     std::shared_ptr<BatchChannel> channel,
                                     std::shared_ptr<store::PointStore> store,
                                     std::shared_ptr<processing::FilterSettings> filter,
                                     std::shared_ptr<IPresentationSink> sink,
                                     std::shared_ptr<spdlog::logger> logger)
    : cfg_(cfg), channel_(std::move(channel)), store_(std::move(store)), filter_(std::move(filter)),
      sink_(std::move(sink)), logger_(std::move(logger)) {
    if (cfg_.decimation_factor == 0) cfg_.decimation_factor = 1;
    sessionStart_ = Clock::now();
    latestRaw_ = std::make_shared<const std::vector<common::Point>>();
    latestView_ = latestRaw_;
}

PipelineScheduler::~PipelineScheduler() {
    if (token_) token_->cancel();
    join();
}

void PipelineScheduler::start(std::shared_ptr<CancellationToken> token, FaultHandler onFault) {
    if (running_.exchange(true)) return;
    join(); // reap a loop that ended on its own (fault)
    token_ = token;
    worker_ = std::thread(&PipelineScheduler::runLoop, this, std::move(token), std::move(onFault));
    if (logger_) logger_->info("PipelineScheduler started (tick={}ms decimation={})",
                               cfg_.tick_interval.count(), cfg_.decimation_factor);
}

void PipelineScheduler::join() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void PipelineScheduler::runLoop(std::shared_ptr<CancellationToken> token, FaultHandler onFault) {
    auto next_tp = Clock::now();
    try {
        while (!token->isCancelled()) {
            if (!tick()) {
                running_.store(false);
                auto fault = lastFault();
                if (onFault && fault) onFault(*fault);
                return;
            }
            next_tp += cfg_.tick_interval;
            const auto now = Clock::now();
            if (next_tp < now) next_tp = now; // overran; no catch-up burst
            std::this_thread::sleep_until(next_tp);
        }
    } catch (const std::exception& ex) {
        if (logger_) logger_->error("PipelineScheduler loop aborted: {}", ex.what());
        common::FaultReport report{common::FaultKind::Channel, std::string("scheduler error: ") + ex.what()};
        {
            std::lock_guard<std::mutex> lock(publishMutex_);
            lastFault_ = report;
        }
        running_.store(false);
        if (onFault) onFault(report);
        return;
    }
    running_.store(false);
    if (logger_) logger_->info("PipelineScheduler stopped (merged={} recomputes={})",
                               mergedBatches_.load(), recomputeCount_.load());
}

bool PipelineScheduler::tick() {
    if (clearRequested_.exchange(false)) {
        clearContents();
        recompute();
    }
    // Bounded by what is queued now so a fast producer cannot starve the cadence.
    std::size_t pending = channel_->size();
    while (pending-- > 0) {
        auto msg = channel_->tryReceive();
        if (!msg) break;
        if (msg->type == ChannelMessage::Type::Fault) {
            if (logger_) logger_->error("Channel fault [{}]: {}", common::toString(msg->faultKind), msg->description);
            std::lock_guard<std::mutex> lock(publishMutex_);
            lastFault_ = common::FaultReport{msg->faultKind, msg->description};
            return false;
        }
        merge(msg->batch);
        const uint64_t merged = mergedBatches_.fetch_add(1) + 1;
        if (merged % cfg_.decimation_factor == 0) {
            recompute();
        }
    }
    if (filter_->version() != filterVersionSeen_.load()) {
        recompute();
    }
    return true;
}

void PipelineScheduler::finish() {
    // A clear accepted while scanning must not be lost when the loop ends before its tick.
    if (clearRequested_.exchange(false)) clearContents();
    uint64_t late = 0;
    while (auto msg = channel_->tryReceive()) {
        if (msg->type == ChannelMessage::Type::Data) {
            merge(msg->batch);
            mergedBatches_.fetch_add(1);
            ++late;
        } else if (logger_) {
            logger_->debug("Ignoring fault after scan end [{}]: {}", common::toString(msg->faultKind), msg->description);
        }
    }
    {
        std::lock_guard<std::mutex> lock(publishMutex_);
        sessionEnd_ = Clock::now();
    }
    recompute();
    if (logger_) logger_->info("Final recompute: merged={} (late={}) stored={}",
                               mergedBatches_.load(), late, storeSize_.load());
}

void PipelineScheduler::recompute() {
    PointSnapshot raw = store_->snapshot();
    // Version first: a concurrent set() then shows up as a change on the next tick.
    filterVersionSeen_.store(filter_->version());
    const auto cfg = filter_->get();
    PointSnapshot view = raw;
    auto filtered = processing::refilter(*raw, cfg);
    if (filtered.size() != raw->size()) {
        view = std::make_shared<const std::vector<common::Point>>(std::move(filtered));
    }
    auto metrics = processing::computeRoomMetrics(*view);
    {
        std::lock_guard<std::mutex> lock(publishMutex_);
        latestRaw_ = raw;
        latestView_ = view;
        latestMetrics_ = metrics;
    }
    recomputeCount_.fetch_add(1);
    if (!sink_) return;
    try {
        sink_->onBatchMerged(view, metrics);
    } catch (const std::exception& ex) {
        if (logger_) logger_->warn("Presentation sink threw in onBatchMerged: {}", ex.what());
    }
}

void PipelineScheduler::merge(const common::Batch& batch) {
    store_->insertBatch(batch);
    pointsReceived_.fetch_add(batch.points.size());
    updateStoreCounters();
}

void PipelineScheduler::updateStoreCounters() {
    storeSize_.store(store_->size());
}

void PipelineScheduler::clearContents() {
    store_->clear();
    mergedBatches_.store(0);
    pointsReceived_.store(0);
    updateStoreCounters();
    if (logger_) logger_->info("Point store cleared");
}

void PipelineScheduler::resetSession(uint64_t scanCount) {
    clearRequested_.store(false);
    store_->clear();
    mergedBatches_.store(scanCount);
    recomputeCount_.store(0);
    pointsReceived_.store(0);
    updateStoreCounters();
    auto empty = std::make_shared<const std::vector<common::Point>>();
    std::lock_guard<std::mutex> lock(publishMutex_);
    latestRaw_ = empty;
    latestView_ = empty;
    latestMetrics_.reset();
    lastFault_.reset();
    sessionStart_ = Clock::now();
    sessionEnd_.reset();
}

void PipelineScheduler::attachChannel(std::shared_ptr<BatchChannel> channel) {
    if (running_.load()) {
        throw std::logic_error("PipelineScheduler::attachChannel while the loop is running");
    }
    channel_ = std::move(channel);
}

void PipelineScheduler::adoptStore(uint64_t scanCount) {
    clearRequested_.store(false);
    mergedBatches_.store(scanCount);
    recomputeCount_.store(0);
    pointsReceived_.store(store_->size());
    updateStoreCounters();
    {
        std::lock_guard<std::mutex> lock(publishMutex_);
        lastFault_.reset();
        sessionStart_ = Clock::now();
        sessionEnd_ = sessionStart_;
    }
    recompute();
}

void PipelineScheduler::clearStore() {
    if (running_.load()) {
        clearRequested_.store(true);
        return;
    }
    clearContents();
    recompute();
}

PointSnapshot PipelineScheduler::latestSnapshot() const {
    std::lock_guard<std::mutex> lock(publishMutex_);
    return latestView_;
}

PointSnapshot PipelineScheduler::latestRaw() const {
    std::lock_guard<std::mutex> lock(publishMutex_);
    return latestRaw_;
}

std::optional<processing::RoomMetrics> PipelineScheduler::latestMetrics() const {
    std::lock_guard<std::mutex> lock(publishMutex_);
    return latestMetrics_;
}

std::optional<common::FaultReport> PipelineScheduler::lastFault() const {
    std::lock_guard<std::mutex> lock(publishMutex_);
    return lastFault_;
}

processing::SessionStats PipelineScheduler::sessionStats() const {
    processing::SessionStats s;
    s.scans_processed = mergedBatches_.load();
    s.total_points = static_cast<std::size_t>(storeSize_.load());
    s.points_received = pointsReceived_.load();
    s.memory_bytes = s.total_points * sizeof(common::Point);
    Clock::time_point start, end;
    {
        std::lock_guard<std::mutex> lock(publishMutex_);
        start = sessionStart_;
        end = sessionEnd_ ? *sessionEnd_ : Clock::now();
    }
    s.duration_s = std::chrono::duration<double>(end - start).count();
    s.points_per_second = s.duration_s > 0.0 ? static_cast<double>(s.total_points) / s.duration_s : 0.0;
    return s;
}

} // namespace lidarmap::backend::pipeline
