#include "BoundedQueue.hpp"
#include "Errors.hpp"
#include "Pipeline.hpp"
#include "Scenario.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>

/** A passes to B; ball rests, travels 10 m at 10 m/s, rests. */
static std::vector<FrameBatch> pass_stream(int frames = 60)
{
    std::vector<FrameBatch> out;
    for (int f = 0; f < frames; ++f) {
        double bx = f < 5 ? 40.0 : std::min(50.0, 40.0 + 0.4 * (f - 4));
        FrameBatch b;
        b.frame = f;
        b.ts = f * kFrameDt;
        b.dets = {point(DetectionClass::Player, 40, 34, 0),
                  point(DetectionClass::Player, 50, 34, 0),
                  point(DetectionClass::Ball, bx, 34)};
        out.push_back(b);
    }
    return out;
}

static FrameBatch empty_frame(long frame, double ts)
{
    FrameBatch b;
    b.frame = frame;
    b.ts = ts;
    return b;
}

TEST(AnalysisPipeline, PassScenarioEndToEnd)
{
    AnalysisPipeline pipeline(identity_config());
    for (const auto& b : pass_stream()) pipeline.submit(b);
    AnalysisResult r = pipeline.finish();

    EXPECT_TRUE(r.complete());
    EXPECT_EQ(r.frames_processed, 60);
    ASSERT_EQ(r.tracks.size(), 3u);
    EXPECT_EQ(r.tracks[2].cls, DetectionClass::Ball);

    ASSERT_EQ(r.events.size(), 1u);
    EXPECT_EQ(r.events[0].type, EventType::Pass);
    EXPECT_EQ(r.events[0].pass.from, 0);
    EXPECT_EQ(r.events[0].pass.to, 1);
    EXPECT_EQ(r.events[0].pass.outcome, PassOutcome::Complete);
    EXPECT_EQ(r.events[0].ball_track, 2);

    EXPECT_EQ(r.technical[0].passes, 1);
    EXPECT_DOUBLE_EQ(r.technical[0].pass_accuracy, 100.0);
    EXPECT_EQ(r.technical[1].passes, 0);
    EXPECT_NEAR(r.tracks[2].kinematics.total_distance, 10.0, 1e-6);
    EXPECT_GT(r.tactical.possession.percentage[0], 0.0);
}

TEST(AnalysisPipeline, DuplicateTimestampRejectsStream)
{
    AnalysisPipeline pipeline(identity_config());
    pipeline.submit(empty_frame(0, 0.0));
    pipeline.submit(empty_frame(1, 0.04));
    EXPECT_THROW(pipeline.submit(empty_frame(2, 0.04)), SequenceError);
    // The stream stays rejected
    EXPECT_THROW(pipeline.submit(empty_frame(3, 0.12)), SequenceError);

    AnalysisResult r = pipeline.finish();
    EXPECT_EQ(r.completion, Completion::SequenceRejected);
    EXPECT_FALSE(r.abort_reason.empty());
    EXPECT_EQ(r.frames_processed, 2);
}

TEST(AnalysisPipeline, OutOfOrderRejected)
{
    AnalysisPipeline a(identity_config());
    a.submit(empty_frame(0, 1.0));
    EXPECT_THROW(a.submit(empty_frame(1, 0.5)), SequenceError);

    AnalysisPipeline b(identity_config());
    b.submit(empty_frame(4, 1.0));
    EXPECT_THROW(b.submit(empty_frame(4, 1.04)), SequenceError);
}

TEST(AnalysisPipeline, MalformedDetectionSkipsFrame)
{
    AnalysisPipeline pipeline(identity_config());
    pipeline.submit(empty_frame(0, 0.0));

    FrameBatch bad = empty_frame(1, 0.04);
    Detection d = point(DetectionClass::Player, 10, 10);
    d.w = -3;
    bad.dets = {point(DetectionClass::Player, 20, 20), d};
    pipeline.submit(bad);

    FrameBatch undecoded = empty_frame(2, 0.08);
    undecoded.malformed = "undecodable detection";
    pipeline.submit(undecoded);

    pipeline.submit(empty_frame(3, 0.12));
    AnalysisResult r = pipeline.finish();

    EXPECT_TRUE(r.complete());
    EXPECT_EQ(r.frames_processed, 2);
    EXPECT_EQ(r.frames_skipped, 2);
    ASSERT_EQ(r.warnings.size(), 2u);
    EXPECT_EQ(r.warnings[0].frame, 1);
    EXPECT_TRUE(r.tracks.empty());
}

TEST(AnalysisPipeline, AbortKeepsPartialResult)
{
    AnalysisPipeline pipeline(identity_config());
    auto stream = pass_stream();
    for (int i = 0; i < 10; ++i) pipeline.submit(stream[i]);
    pipeline.abort("operator stop");
    for (int i = 10; i < 20; ++i) pipeline.submit(stream[i]);

    AnalysisResult r = pipeline.finish();
    EXPECT_EQ(r.completion, Completion::Aborted);
    EXPECT_EQ(r.abort_reason, "operator stop");
    EXPECT_EQ(r.frames_processed, 10);
    EXPECT_EQ(r.tracks.size(), 3u);
    EXPECT_THROW(pipeline.finish(), std::logic_error);
}

TEST(AnalysisPipeline, BadCalibrationFailsConstruction)
{
    PipelineConfig cfg = identity_config();
    cfg.calibration.homography = cv::Matx33d::zeros();
    EXPECT_THROW(AnalysisPipeline{cfg}, CalibrationError);

    cfg = identity_config();
    cfg.tracker.gating_distance = -1.0;
    EXPECT_THROW(AnalysisPipeline{cfg}, ConfigError);
}

TEST(AnalysisPipeline, SharedCalibrationCache)
{
    CalibrationCache cache;
    AnalysisPipeline a(identity_config(), &cache);
    AnalysisPipeline b(identity_config(), &cache);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(&a.calibration(), &b.calibration());
}

// -------- run() through the bounded queue --------------

TEST(AnalysisPipelineRun, DrainsSourceThroughSmallQueue)
{
    PipelineConfig cfg = identity_config();
    cfg.queue_capacity = 2;
    AnalysisPipeline pipeline(cfg);
    BatchListSource source(pass_stream(120));

    AnalysisResult r = pipeline.run(source);
    EXPECT_TRUE(r.complete());
    EXPECT_EQ(r.frames_processed, 120);
    ASSERT_EQ(r.events.size(), 1u);
    EXPECT_EQ(r.events[0].type, EventType::Pass);
}

TEST(AnalysisPipelineRun, SequenceErrorYieldsPartialResult)
{
    auto stream = pass_stream(20);
    stream[12].ts = stream[3].ts;
    AnalysisPipeline pipeline(identity_config());
    BatchListSource source(stream);

    AnalysisResult r = pipeline.run(source);
    EXPECT_EQ(r.completion, Completion::SequenceRejected);
    EXPECT_EQ(r.frames_processed, 12);
    EXPECT_EQ(r.tracks.size(), 3u);
}

class FailingSource : public DetectionSource
{
public:
    std::optional<FrameBatch> next() override
    {
        if (n_ == 3) throw std::runtime_error("detector disconnected");
        long f = n_++;
        return empty_frame(f, f * kFrameDt);
    }

private:
    long n_ = 0;
};

TEST(AnalysisPipelineRun, SourceFailureYieldsPartialResult)
{
    AnalysisPipeline pipeline(identity_config());
    FailingSource source;
    AnalysisResult r = pipeline.run(source);

    EXPECT_EQ(r.completion, Completion::SourceFailed);
    EXPECT_EQ(r.abort_reason, "detector disconnected");
    EXPECT_EQ(r.frames_processed, 3);
}

class AbortingSource : public DetectionSource
{
public:
    explicit AbortingSource(AnalysisPipeline& p) : pipeline_(p) {}

    std::optional<FrameBatch> next() override
    {
        if (n_ == 5) pipeline_.abort("caller gave up");
        long f = n_++;
        return empty_frame(f, f * kFrameDt);
    }

private:
    AnalysisPipeline& pipeline_;
    long n_ = 0;
};

TEST(AnalysisPipelineRun, AbortDuringRun)
{
    AnalysisPipeline pipeline(identity_config());
    AbortingSource source(pipeline);
    AnalysisResult r = pipeline.run(source);

    EXPECT_EQ(r.completion, Completion::Aborted);
    EXPECT_EQ(r.abort_reason, "caller gave up");
    EXPECT_LE(r.frames_processed, 5);
}

// -------- BoundedQueue --------------

TEST(BoundedQueue, CloseDrainsRemainingItems)
{
    BoundedQueue<int> q(4);
    EXPECT_TRUE(q.push(1));
    EXPECT_TRUE(q.push(2));
    q.close();
    EXPECT_FALSE(q.push(3));
    EXPECT_EQ(q.pop().value_or(-1), 1);
    EXPECT_EQ(q.pop().value_or(-1), 2);
    EXPECT_FALSE(q.pop().has_value());
}

TEST(BoundedQueue, CancelDropsItems)
{
    BoundedQueue<int> q(4);
    q.push(1);
    q.cancel();
    EXPECT_FALSE(q.pop().has_value());
    EXPECT_EQ(q.size(), 0u);
}

TEST(BoundedQueue, ProducerBlocksWhenFull)
{
    BoundedQueue<int> q(2);
    std::thread producer([&] {
        for (int i = 0; i < 100; ++i) q.push(i);
        q.close();
    });

    int expected = 0;
    while (auto v = q.pop()) {
        EXPECT_LE(q.size(), q.capacity());
        EXPECT_EQ(*v, expected++);
    }
    producer.join();
    EXPECT_EQ(expected, 100);
}
