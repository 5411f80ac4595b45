#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "pipeline/BatchChannel.h"
#include "pipeline/CancellationToken.h"
#include "pipeline/PipelineScheduler.h"
#include "processing/FilterSettings.h"
#include "store/PointStore.h"
#include "helpers/RecordingSink.h"
#include "helpers/TestLogging.h"

using namespace lidarmap::backend;
using lidarmap::backend::tests::RecordingSink;

namespace {

common::Batch batchOf(std::initializer_list<double> xs, double distance = 1000.0) {
    common::Batch b;
    for (double x : xs) b.points.emplace_back(x, 0.0, 10, distance);
    return b;
}

class ThrowingSink : public pipeline::IPresentationSink {
public:
    void onBatchMerged(const pipeline::PointSnapshot&, const std::optional<processing::RoomMetrics>&) override {
        ++calls;
        throw std::runtime_error("widget gone");
    }
    void onFault(common::FaultKind, const std::string&) override {}
    void onStateChanged(pipeline::PipelineState) override {}
    int calls = 0;
};

class SchedulerFixture : public ::testing::Test {
protected:
    void build(std::size_t capacity, uint32_t decimation,
               std::shared_ptr<pipeline::IPresentationSink> sinkOverride = nullptr,
               std::chrono::milliseconds tick = std::chrono::milliseconds(5)) {
        channel = std::make_shared<pipeline::BatchChannel>(1024);
        pointStore = std::make_shared<store::PointStore>(capacity);
        filter = std::make_shared<processing::FilterSettings>();
        sink = std::make_shared<RecordingSink>();
        pipeline::PipelineScheduler::Config cfg;
        cfg.decimation_factor = decimation;
        cfg.tick_interval = tick;
        scheduler = std::make_unique<pipeline::PipelineScheduler>(
            cfg, channel, pointStore, filter, sinkOverride ? sinkOverride : sink, tests::testLogger("Test.Scheduler"));
    }

    std::vector<double> viewXs() const {
        std::vector<double> xs;
        for (const auto& p : *scheduler->latestSnapshot()) xs.push_back(p.x_mm);
        return xs;
    }

    std::shared_ptr<pipeline::BatchChannel> channel;
    std::shared_ptr<store::PointStore> pointStore;
    std::shared_ptr<processing::FilterSettings> filter;
    std::shared_ptr<RecordingSink> sink;
    std::unique_ptr<pipeline::PipelineScheduler> scheduler;
};

} // namespace

TEST_F(SchedulerFixture, RecomputesEveryThirdBatchPlusOneFinal) {
    build(1000, 3);
    for (int i = 0; i < 9; ++i) channel->sendData(batchOf({static_cast<double>(i)}));
    ASSERT_TRUE(scheduler->tick());
    EXPECT_EQ(scheduler->mergedBatches(), 9u);
    EXPECT_EQ(scheduler->recomputeCount(), 3u);
    EXPECT_EQ(sink->mergedCount(), 3u);
    EXPECT_EQ(sink->viewSizes(), (std::vector<std::size_t>{3, 6, 9}));

    scheduler->finish();
    EXPECT_EQ(scheduler->recomputeCount(), 4u);
    EXPECT_EQ(sink->mergedCount(), 4u);
}

TEST_F(SchedulerFixture, DecimationCountsAcrossTicks) {
    build(1000, 3);
    channel->sendData(batchOf({1}));
    channel->sendData(batchOf({2}));
    ASSERT_TRUE(scheduler->tick());
    EXPECT_EQ(scheduler->recomputeCount(), 0u);
    channel->sendData(batchOf({3}));
    ASSERT_TRUE(scheduler->tick());
    EXPECT_EQ(scheduler->recomputeCount(), 1u);
    ASSERT_TRUE(scheduler->tick()); // nothing queued, nothing changed
    EXPECT_EQ(scheduler->recomputeCount(), 1u);
}

TEST_F(SchedulerFixture, EvictionVisibleInPublishedView) {
    build(5, 1);
    channel->sendData(batchOf({1, 2, 3}));
    channel->sendData(batchOf({4, 5, 6}));
    ASSERT_TRUE(scheduler->tick());
    EXPECT_EQ(viewXs(), (std::vector<double>{2, 3, 4, 5, 6}));
    channel->sendData(batchOf({7}));
    ASSERT_TRUE(scheduler->tick());
    EXPECT_EQ(viewXs(), (std::vector<double>{3, 4, 5, 6, 7}));
}

TEST_F(SchedulerFixture, FaultStopsDrainAndLeavesRestQueued) {
    build(100, 1);
    channel->sendData(batchOf({1}));
    channel->sendFault(common::FaultKind::Channel, "sensor frame stream ended");
    channel->sendData(batchOf({2}));
    EXPECT_FALSE(scheduler->tick());
    EXPECT_EQ(scheduler->mergedBatches(), 1u);
    auto fault = scheduler->lastFault();
    ASSERT_TRUE(fault.has_value());
    EXPECT_EQ(fault->kind, common::FaultKind::Channel);
    EXPECT_EQ(fault->description, "sensor frame stream ended");
    EXPECT_EQ(channel->size(), 1u);

    // finish() still merges late data and publishes once.
    scheduler->finish();
    EXPECT_EQ(scheduler->mergedBatches(), 2u);
    EXPECT_EQ(viewXs(), (std::vector<double>{1, 2}));
}

TEST_F(SchedulerFixture, FilterChangeRefiltersPublishedViewOnly) {
    build(100, 1);
    channel->sendData(batchOf({1, 2}, 1000.0));
    channel->sendData(batchOf({3}, 3000.0));
    ASSERT_TRUE(scheduler->tick());
    EXPECT_EQ(scheduler->latestSnapshot()->size(), 3u);

    common::FilterConfig strict;
    strict.max_distance_mm = 2000.0;
    filter->set(strict);
    const auto before = scheduler->recomputeCount();
    ASSERT_TRUE(scheduler->tick());
    EXPECT_EQ(scheduler->recomputeCount(), before + 1);
    EXPECT_EQ(viewXs(), (std::vector<double>{1, 2}));
    EXPECT_EQ(scheduler->latestRaw()->size(), 3u);
    EXPECT_EQ(pointStore->size(), 3u);

    // Relaxing the filter brings the stored point back.
    filter->set(common::FilterConfig{});
    ASSERT_TRUE(scheduler->tick());
    EXPECT_EQ(scheduler->latestSnapshot()->size(), 3u);
}

TEST_F(SchedulerFixture, MetricsPublishedOnceEnoughPoints) {
    build(1000, 1);
    common::Batch b;
    for (int i = 0; i < 99; ++i) b.points.emplace_back(i * 10.0, 0.0, 10, 1000.0);
    channel->sendData(b);
    ASSERT_TRUE(scheduler->tick());
    EXPECT_FALSE(scheduler->latestMetrics().has_value());
    EXPECT_FALSE(sink->lastMetrics().has_value());
    channel->sendData(batchOf({-10.0}));
    ASSERT_TRUE(scheduler->tick());
    auto m = scheduler->latestMetrics();
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->point_count, 100u);
    EXPECT_DOUBLE_EQ(m->width, 990.0);
    ASSERT_TRUE(sink->lastMetrics().has_value());
}

TEST_F(SchedulerFixture, ClearStoreWhileIdlePublishesEmptyView) {
    build(100, 1);
    channel->sendData(batchOf({1, 2, 3}));
    ASSERT_TRUE(scheduler->tick());
    scheduler->clearStore();
    EXPECT_TRUE(pointStore->empty());
    EXPECT_TRUE(scheduler->latestSnapshot()->empty());
    EXPECT_EQ(scheduler->sessionStats().total_points, 0u);
    EXPECT_EQ(scheduler->mergedBatches(), 0u);
}

TEST_F(SchedulerFixture, ClearRequestedJustBeforeStopIsServedByFinish) {
    // Long cadence so cancellation lands before the tick that would serve the clear.
    build(100, 1, nullptr, std::chrono::milliseconds(400));
    auto token = std::make_shared<pipeline::CancellationToken>();
    scheduler->start(token, nullptr);
    channel->sendData(batchOf({1, 2, 3}));
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (scheduler->mergedBatches() < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    ASSERT_EQ(scheduler->mergedBatches(), 1u);

    scheduler->clearStore();
    channel->sendData(batchOf({7}));
    token->cancel();
    scheduler->join();
    scheduler->finish();

    // Cleared first, then the batch queued behind the request is merged.
    EXPECT_EQ(viewXs(), (std::vector<double>{7}));
    EXPECT_EQ(pointStore->size(), 1u);
    EXPECT_EQ(scheduler->mergedBatches(), 1u);
    EXPECT_EQ(sink->lastView()->size(), 1u);
}

TEST_F(SchedulerFixture, AttachedChannelReplacesPreviousOne) {
    build(100, 1);
    auto next = std::make_shared<pipeline::BatchChannel>(16);
    scheduler->attachChannel(next);
    channel->sendData(batchOf({1, 2}));
    next->sendData(batchOf({5}));
    ASSERT_TRUE(scheduler->tick());
    EXPECT_EQ(viewXs(), (std::vector<double>{5}));
    EXPECT_EQ(channel->size(), 1u);

    auto token = std::make_shared<pipeline::CancellationToken>();
    scheduler->start(token, nullptr);
    EXPECT_THROW(scheduler->attachChannel(channel), std::logic_error);
    token->cancel();
    scheduler->join();
}

TEST_F(SchedulerFixture, SessionStatsTrackMergedData) {
    build(4, 1);
    channel->sendData(batchOf({1, 2, 3}));
    channel->sendData(batchOf({4, 5, 6}));
    ASSERT_TRUE(scheduler->tick());
    auto s = scheduler->sessionStats();
    EXPECT_EQ(s.scans_processed, 2u);
    EXPECT_EQ(s.total_points, 4u);
    EXPECT_EQ(s.points_received, 6u);
    EXPECT_EQ(s.memory_bytes, 4u * sizeof(common::Point));
    EXPECT_GE(s.duration_s, 0.0);
}

TEST_F(SchedulerFixture, ResetSessionStartsFromScanCount) {
    build(100, 1);
    channel->sendData(batchOf({1}));
    ASSERT_TRUE(scheduler->tick());
    scheduler->resetSession(12);
    EXPECT_TRUE(pointStore->empty());
    EXPECT_EQ(scheduler->mergedBatches(), 12u);
    EXPECT_EQ(scheduler->recomputeCount(), 0u);
    EXPECT_TRUE(scheduler->latestSnapshot()->empty());
}

TEST_F(SchedulerFixture, ThrowingSinkDoesNotBreakTick) {
    auto throwing = std::make_shared<ThrowingSink>();
    build(100, 1, throwing);
    channel->sendData(batchOf({1}));
    channel->sendData(batchOf({2}));
    EXPECT_TRUE(scheduler->tick());
    EXPECT_EQ(throwing->calls, 2);
    EXPECT_EQ(scheduler->latestSnapshot()->size(), 2u);
}

TEST_F(SchedulerFixture, ThreadedLoopMergesUntilCancelled) {
    build(1000, 2);
    auto token = std::make_shared<pipeline::CancellationToken>();
    std::atomic<int> faults{0};
    scheduler->start(token, [&](const common::FaultReport&) { faults++; });
    EXPECT_TRUE(scheduler->isRunning());
    for (int i = 0; i < 6; ++i) channel->sendData(batchOf({static_cast<double>(i)}));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (scheduler->mergedBatches() < 6 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    token->cancel();
    scheduler->join();
    EXPECT_FALSE(scheduler->isRunning());
    EXPECT_EQ(scheduler->mergedBatches(), 6u);
    EXPECT_EQ(scheduler->recomputeCount(), 3u);
    EXPECT_EQ(faults.load(), 0);
}

TEST_F(SchedulerFixture, ThreadedLoopReportsFaultAndExits) {
    build(1000, 3);
    auto token = std::make_shared<pipeline::CancellationToken>();
    std::atomic<int> faults{0};
    common::FaultReport seen;
    std::mutex m;
    scheduler->start(token, [&](const common::FaultReport& r) {
        std::lock_guard<std::mutex> lock(m);
        seen = r;
        faults++;
    });
    channel->sendData(batchOf({1}));
    channel->sendFault(common::FaultKind::Frame, "3 consecutive frame read errors");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (faults.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    scheduler->join();
    ASSERT_EQ(faults.load(), 1);
    std::lock_guard<std::mutex> lock(m);
    EXPECT_EQ(seen.kind, common::FaultKind::Frame);
    EXPECT_FALSE(scheduler->isRunning());
    EXPECT_FALSE(token->isCancelled());
}
