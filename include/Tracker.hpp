#pragma once
#include "Config.hpp"
#include "Types.hpp"
#include <opencv2/video/tracking.hpp>
#include <map>
#include <vector>

struct Track
{
    int             id          = -1;
    DetectionClass  cls         = DetectionClass::Player;
    TrackStatus     status      = TrackStatus::Active;
    cv::KalmanFilter kf;                    // [x y vx vy] in pitch metres
    cv::Point2d     position;               // from the *KF state*
    cv::Point2d     velocity;
    double          filter_ts   = 0.0;      // time the KF state refers to
    double          created_ts  = 0.0;
    double          last_ts     = 0.0;      // last matched detection
    double          lost_ts     = -1.0;
    int             time_since_update = 0;  // consecutive missed frames
    int             active_streak = 0;      // consecutive matched frames
    double          last_area   = 0.0;      // pixel bbox area of the last match
    int             team_votes[2] = {0, 0};
    int             last_team   = kUnknownTeam;
    std::vector<TrackSample> samples;

    /** Majority team label over matched detections. */
    int    team() const;
    /** Positional standard deviation of the current KF state, metres. */
    double uncertainty() const;
    bool   live() const { return status != TrackStatus::Lost; }
};

/** Arena of every track ever created. Entries are never erased, ids never reused. */
class TrackStore
{
public:
    Track& create(DetectionClass cls);

    Track*       find(int id);
    const Track* find(int id) const;

    const std::map<int, Track>& all() const { return tracks_; }
    std::map<int, Track>&       all() { return tracks_; }
    std::vector<int> live_ids(DetectionClass cls) const;
    size_t size() const { return tracks_.size(); }

private:
    std::map<int, Track> tracks_;
    int next_id_ = 0;
};

/** A detection with both coordinate frames resolved. */
struct ProjectedDetection
{
    Detection   det;
    cv::Point2d pixel;
    cv::Point2d pitch;
};

struct SnapshotEntry
{
    int            track_id;
    DetectionClass cls;
    int            team;
    TrackStatus    status;
    cv::Point2d    position;
    double         uncertainty;
};

/** What we emit each frame: every ACTIVE or COASTING track. */
struct FrameSnapshot
{
    long   frame = 0;
    double ts    = 0.0;
    std::vector<SnapshotEntry> entries;

    const SnapshotEntry* find(int track_id) const;
};

class Tracker
{
public:
    explicit Tracker(const TrackerConfig& cfg);

    /** Predict, associate and update all tracks for one frame. */
    FrameSnapshot step(long frame, double ts,
                       const std::vector<ProjectedDetection>& dets);

    const TrackStore& store() const { return store_; }
    /** Id of the live ball track, -1 when there is none. */
    int ball_id() const { return ball_id_; }

private:
    // ─── helpers (implemented in Tracker.cpp) ────────────────────────
    double cost(const Track& t, const ProjectedDetection& d) const;
    void   predict(Track& t, double ts) const;
    void   update(Track& t, const ProjectedDetection& d, long frame, double ts) const;
    void   miss(Track& t, double ts) const;
    Track& spawn(const ProjectedDetection& d, long frame, double ts);
    void   associate(DetectionClass cls, const std::vector<const ProjectedDetection*>& dets,
                     long frame, double ts);
    void   step_ball(const std::vector<const ProjectedDetection*>& dets, long frame, double ts);

    static void set_F(cv::KalmanFilter& kf, double dt);
    void        set_Q(cv::KalmanFilter& kf, double dt) const;
    cv::KalmanFilter create_kf(const cv::Point2d& p) const;

    // ─── data ───────────────────────────────────────────────────────
    TrackerConfig cfg_;
    TrackStore    store_;
    int           ball_id_ = -1;
};
