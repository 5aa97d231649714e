#pragma once
#include "Calibration.hpp"
#include "Config.hpp"
#include "Report.hpp"
#include "Tracker.hpp"
#include "Types.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/** Ordered stream of detection batches, e.g. a detector adapter or a file. */
class DetectionSource
{
public:
    virtual ~DetectionSource() = default;

    /** Next batch in stream order, empty at the end. Throws when the stream cannot be read. */
    virtual std::optional<FrameBatch> next() = 0;
};

class BatchListSource : public DetectionSource
{
public:
    explicit BatchListSource(std::vector<FrameBatch> batches);
    std::optional<FrameBatch> next() override;

private:
    std::vector<FrameBatch> batches_;
    size_t pos_ = 0;
};

/**
 * One analysis of one detection stream: calibration, tracking per frame,
 * then kinematics, events and tactics over the finished tracks.
 *
 * Construction throws ConfigError or CalibrationError. submit() throws
 * SequenceError and the stream stays rejected; finish() still returns what
 * was tracked up to that point.
 */
class AnalysisPipeline
{
public:
    using SnapshotListener = std::function<void(const FrameSnapshot&)>;

    explicit AnalysisPipeline(const PipelineConfig& cfg, CalibrationCache* cache = nullptr);

    void submit(const FrameBatch& batch);
    AnalysisResult finish();
    /** Stop taking frames. Safe to call from another thread. */
    void abort(const std::string& reason);

    /** Pull every batch from `src` through a bounded queue, then finish(). */
    AnalysisResult run(DetectionSource& src);

    void on_snapshot(SnapshotListener listener) { listener_ = std::move(listener); }

    const Calibration& calibration() const { return *calib_; }
    const Tracker&     tracker() const { return tracker_; }
    long frames_processed() const { return processed_; }
    long frames_skipped() const { return skipped_; }
    bool aborted() const { return abort_; }

private:
    void check_sequence(const FrameBatch& batch);
    void warn(const FrameBatch& batch, const std::string& message);
    void stop(Completion why, const std::string& reason);

    PipelineConfig                     cfg_;
    std::shared_ptr<const Calibration> calib_;
    Tracker                            tracker_;
    SnapshotListener                   listener_;

    std::vector<FrameSnapshot>         snapshots_;
    std::vector<DetectionFrameWarning> warnings_;
    long   processed_ = 0;
    long   skipped_ = 0;
    bool   have_last_ = false;
    long   last_frame_ = 0;
    double first_ts_ = 0.0, last_ts_ = 0.0;
    bool   finished_ = false;

    std::atomic<bool> abort_{false};
    std::mutex        stop_mu_;
    Completion        completion_ = Completion::Complete;
    std::string       stop_reason_;
};
