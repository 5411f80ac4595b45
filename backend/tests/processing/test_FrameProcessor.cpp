#include <gtest/gtest.h>

#include "processing/FrameProcessor.h"
#include "helpers/TestLogging.h"

using lidarmap::backend::common::FilterConfig;
using lidarmap::backend::common::Measurement;
using lidarmap::backend::common::ScanFrame;
using lidarmap::backend::processing::FrameProcessor;

namespace {
ScanFrame makeFrame(uint64_t index, std::vector<Measurement> m) {
    ScanFrame f;
    f.index = index;
    f.measurements = std::move(m);
    return f;
}
}

TEST(FrameProcessor, KeepsMeasurementOrderAndCountsRejects) {
    FrameProcessor fp(lidarmap::backend::tests::testLogger("Test.Processing.Frames"));
    FilterConfig cfg;
    cfg.max_distance_mm = 5000.0;
    auto frame = makeFrame(7, {
        Measurement(10, 0.0, 1000.0),
        Measurement(0, 10.0, 1000.0),   // quality 0
        Measurement(10, 90.0, 2000.0),
        Measurement(10, 45.0, 9000.0),  // too far
        Measurement(10, 180.0, 0.0),    // no return
        Measurement(10, 270.0, 3000.0),
    });
    auto batch = fp.process(frame, cfg);
    EXPECT_EQ(batch.frame_index, 7u);
    ASSERT_EQ(batch.points.size(), 3u);
    EXPECT_NEAR(batch.points[0].x_mm, 1000.0, 1e-6);
    EXPECT_NEAR(batch.points[1].y_mm, 2000.0, 1e-6);
    EXPECT_NEAR(batch.points[2].y_mm, -3000.0, 1e-6);
    EXPECT_EQ(fp.lastSummary().accepted, 3u);
    EXPECT_EQ(fp.lastSummary().rejected, 3u);
}

TEST(FrameProcessor, AllRejectedFrameGivesEmptyBatch) {
    FrameProcessor fp;
    FilterConfig cfg;
    auto batch = fp.process(makeFrame(1, {Measurement(0, 0.0, 100.0), Measurement(5, 0.0, 0.0)}), cfg);
    EXPECT_TRUE(batch.points.empty());
    EXPECT_EQ(fp.lastSummary().rejected, 2u);
}

TEST(FrameProcessor, RunningTotals) {
    FrameProcessor fp;
    FilterConfig cfg;
    fp.process(makeFrame(0, {Measurement(1, 0.0, 100.0), Measurement(1, 1.0, 100.0)}), cfg);
    fp.process(makeFrame(1, {Measurement(1, 0.0, 100.0)}), cfg);
    fp.process(makeFrame(2, {}), cfg);
    EXPECT_EQ(fp.framesProcessed(), 3u);
    EXPECT_EQ(fp.pointsAccepted(), 3u);
    EXPECT_EQ(fp.lastSummary().accepted, 0u);
}
