#include "Pipeline.hpp"
#include "BoundedQueue.hpp"
#include "Errors.hpp"
#include "EventDetector.hpp"
#include "Kinematics.hpp"
#include "TacticalAggregator.hpp"
#include <cmath>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace std;

// -------- utility functions --------------

static const PipelineConfig& validated(const PipelineConfig& cfg)
{
    cfg.validate();
    return cfg;
}

static shared_ptr<const Calibration> make_calibration(const PipelineConfig& cfg,
                                                      CalibrationCache* cache)
{
    if (cache) return cache->get(cfg.calibration, cfg.pitch);
    return make_shared<const Calibration>(Calibration::from_config(cfg.calibration, cfg.pitch));
}

/** Ball and people of one tracked frame, with the ball taken from its smoothed profile. */
static FrameObservation observe(const FrameSnapshot& snap,
                                const map<int, KinematicProfile>& profiles)
{
    FrameObservation obs;
    obs.frame = snap.frame;
    obs.ts = snap.ts;

    for (const auto& e : snap.entries) {
        if (e.cls == DetectionClass::Ball) {
            // only frames where the ball was actually measured
            auto it = profiles.find(e.track_id);
            if (it == profiles.end()) continue;
            const KinematicSample* s = it->second.at_frame(snap.frame);
            if (!s) continue;
            obs.ball = BallObservation{e.track_id, s->position, s->velocity, s->speed};
        } else if (e.cls == DetectionClass::Player || e.cls == DetectionClass::Goalkeeper) {
            obs.people.push_back({e.track_id, e.cls, e.team, e.position});
        }
    }
    return obs;
}

// -----------------------------------------------------------------------------

BatchListSource::BatchListSource(vector<FrameBatch> batches) : batches_(move(batches)) {}

optional<FrameBatch> BatchListSource::next()
{
    if (pos_ >= batches_.size()) return nullopt;
    return batches_[pos_++];
}

// -----------------------------------------------------------------------------

AnalysisPipeline::AnalysisPipeline(const PipelineConfig& cfg, CalibrationCache* cache)
    : cfg_(validated(cfg)),
      calib_(make_calibration(cfg_, cache)),
      tracker_(cfg_.tracker)
{
    cout << "[pipeline] calibration ready for setup '" << cfg_.calibration.setup << "'\n";
}

void AnalysisPipeline::stop(Completion why, const string& reason)
{
    lock_guard<mutex> lock(stop_mu_);
    if (completion_ != Completion::Complete) return;    // first reason wins
    completion_ = why;
    stop_reason_ = reason;
}

void AnalysisPipeline::abort(const string& reason)
{
    stop(Completion::Aborted, reason);
    abort_ = true;
}

void AnalysisPipeline::check_sequence(const FrameBatch& batch)
{
    {
        lock_guard<mutex> lock(stop_mu_);
        if (completion_ == Completion::SequenceRejected)
            throw SequenceError("stream already rejected: " + stop_reason_);
    }

    ostringstream msg;
    if (!isfinite(batch.ts))
        msg << "frame " << batch.frame << " has a non-finite timestamp";
    else if (have_last_ && batch.ts == last_ts_)
        msg << "duplicate timestamp " << batch.ts << " at frame " << batch.frame;
    else if (have_last_ && batch.ts < last_ts_)
        msg << "timestamp " << batch.ts << " at frame " << batch.frame
            << " precedes " << last_ts_;
    else if (have_last_ && batch.frame <= last_frame_)
        msg << "frame index " << batch.frame << " does not follow " << last_frame_;

    if (msg.tellp() > 0) {
        cerr << "[pipeline] sequence error: " << msg.str() << "\n";
        stop(Completion::SequenceRejected, msg.str());
        throw SequenceError(msg.str());
    }

    if (!have_last_) first_ts_ = batch.ts;
    have_last_ = true;
    last_frame_ = batch.frame;
    last_ts_ = batch.ts;
}

void AnalysisPipeline::warn(const FrameBatch& batch, const string& message)
{
    cerr << "[pipeline] frame " << batch.frame << " skipped: " << message << "\n";
    warnings_.push_back({batch.frame, batch.ts, message});
    skipped_++;
}

void AnalysisPipeline::submit(const FrameBatch& batch)
{
    if (finished_) throw logic_error("submit() after finish()");
    if (abort_) return;
    check_sequence(batch);

    if (!batch.malformed.empty()) {
        warn(batch, batch.malformed);
        return;
    }

    vector<ProjectedDetection> projected;
    projected.reserve(batch.dets.size());
    for (size_t i = 0; i < batch.dets.size(); ++i) {
        const Detection& d = batch.dets[i];
        string reason = validate_detection(d);
        if (reason.empty()) {
            try {
                cv::Point2d pixel = d.anchor();
                cv::Point2d pitch = calib_->to_pitch(pixel);
                if (isfinite(pitch.x) && isfinite(pitch.y))
                    projected.push_back({d, pixel, pitch});
                else
                    reason = "projection is not finite";
            } catch (const CalibrationError& e) {
                reason = e.what();
            }
        }
        if (!reason.empty()) {
            warn(batch, "detection " + std::to_string(i) + ": " + reason);
            return;
        }
    }

    snapshots_.push_back(tracker_.step(batch.frame, batch.ts, projected));
    processed_++;
    if (listener_) listener_(snapshots_.back());
}

AnalysisResult AnalysisPipeline::run(DetectionSource& src)
{
    BoundedQueue<FrameBatch> queue(cfg_.queue_capacity);
    string source_error;

    thread producer([&] {
        try {
            while (!abort_) {
                optional<FrameBatch> b = src.next();
                if (!b || !queue.push(move(*b))) break;
            }
        } catch (const exception& e) {
            source_error = e.what();
        }
        queue.close();
    });

    try {
        while (optional<FrameBatch> b = queue.pop()) {
            if (abort_) break;
            try {
                submit(*b);
            } catch (const SequenceError&) {
                break;      // recorded as the stop reason
            }
        }
    } catch (...) {
        queue.cancel();
        producer.join();
        throw;
    }
    queue.cancel();
    producer.join();

    if (!source_error.empty()) {
        cerr << "[pipeline] detection source failed: " << source_error << "\n";
        stop(Completion::SourceFailed, source_error);
    }
    return finish();
}

AnalysisResult AnalysisPipeline::finish()
{
    if (finished_) throw logic_error("finish() called twice");
    finished_ = true;

    AnalysisResult r;
    {
        lock_guard<mutex> lock(stop_mu_);
        r.completion = completion_;
        r.abort_reason = stop_reason_;
    }
    r.frames_processed = processed_;
    r.frames_skipped = skipped_;
    r.start_ts = first_ts_;
    r.end_ts = last_ts_;
    r.warnings = warnings_;

    // kinematics per archived track
    KinematicsEngine kinematics(cfg_.kinematics, cfg_.tracker.max_coast_frames);
    map<int, KinematicProfile> profiles;
    for (const auto& [id, t] : tracker_.store().all())
        profiles.emplace(id, kinematics.profile(t.samples));

    // events over the whole stream, one context per analysis
    EventDetector detector(cfg_.events, cfg_.pitch);
    MatchContext ctx;
    for (const auto& snap : snapshots_) detector.step(observe(snap, profiles), ctx);
    detector.finish(ctx);

    TacticalAggregator tactical(cfg_.tactical, cfg_.pitch, cfg_.events.team0_attacks_right);
    r.tactical = tactical.aggregate(snapshots_, ctx.episodes);

    r.tracks = ReportAssembler::tracks(tracker_.store(), profiles);
    r.technical = ReportAssembler::technical(ctx.events);
    r.events = move(ctx.events);
    r.episodes = move(ctx.episodes);
    r.omissions = move(ctx.omissions);

    cout << "[pipeline] " << to_string(r.completion) << ": " << r.frames_processed
         << " frames (" << r.frames_skipped << " skipped), " << r.tracks.size()
         << " tracks, " << r.events.size() << " events, " << r.omissions.size()
         << " omissions\n";
    return r;
}
