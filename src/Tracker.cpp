#include "Tracker.hpp"
#include "Assignment.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

using namespace std;

// -------- Track / TrackStore / FrameSnapshot --------------

int Track::team() const
{
    if (team_votes[0] > team_votes[1]) return 0;
    if (team_votes[1] > team_votes[0]) return 1;
    return last_team;
}

double Track::uncertainty() const
{
    const cv::Mat& P = kf.errorCovPost;
    if (P.empty()) return 0.0;
    return sqrt(P.at<double>(0, 0) + P.at<double>(1, 1));
}

Track& TrackStore::create(DetectionClass cls)
{
    int id = next_id_++;
    Track& t = tracks_[id];
    t.id = id;
    t.cls = cls;
    return t;
}

Track* TrackStore::find(int id)
{
    auto it = tracks_.find(id);
    return it == tracks_.end() ? nullptr : &it->second;
}

const Track* TrackStore::find(int id) const
{
    auto it = tracks_.find(id);
    return it == tracks_.end() ? nullptr : &it->second;
}

vector<int> TrackStore::live_ids(DetectionClass cls) const
{
    vector<int> ids;
    for (const auto& [id, t] : tracks_)
        if (t.cls == cls && t.live()) ids.push_back(id);
    return ids;
}

const SnapshotEntry* FrameSnapshot::find(int track_id) const
{
    for (const auto& e : entries)
        if (e.track_id == track_id) return &e;
    return nullptr;
}

// -------- Kalman helpers ------------

// Sets F matrix to account for dt
void Tracker::set_F(cv::KalmanFilter& kf, double dt)
{
    auto& F = kf.transitionMatrix;
    F.at<double>(0, 2) = dt;
    F.at<double>(1, 3) = dt;
}

// Sets process noise Q for a white-noise acceleration model
void Tracker::set_Q(cv::KalmanFilter& kf, double dt) const
{
    double s = cfg_.process_noise;
    double dt2 = dt * dt, dt3 = dt2 * dt, dt4 = dt2 * dt2;
    cv::Mat Q = cv::Mat::zeros(4, 4, CV_64F);

    Q.at<double>(0, 0) = Q.at<double>(1, 1) = dt4 / 4 * s;
    Q.at<double>(0, 2) = Q.at<double>(1, 3) = dt3 / 2 * s;
    Q.at<double>(2, 0) = Q.at<double>(3, 1) = dt3 / 2 * s;
    Q.at<double>(2, 2) = Q.at<double>(3, 3) = dt2 * s;

    kf.processNoiseCov = Q;
}

// Creates a constant-velocity filter with 4D state: [x, y, vx, vy]
cv::KalmanFilter Tracker::create_kf(const cv::Point2d& p) const
{
    cv::KalmanFilter kf(4, 2, 0, CV_64F);

    kf.transitionMatrix = (cv::Mat_<double>(4, 4) <<
        1, 0, 1, 0,
        0, 1, 0, 1,
        0, 0, 1, 0,
        0, 0, 0, 1);

    kf.measurementMatrix = (cv::Mat_<double>(2, 4) <<
        1, 0, 0, 0,
        0, 1, 0, 0);

    kf.statePost = (cv::Mat_<double>(4, 1) << p.x, p.y, 0, 0);

    // Position known to measurement accuracy, velocity up to ~10 m/s
    kf.errorCovPost = cv::Mat::zeros(4, 4, CV_64F);
    kf.errorCovPost.at<double>(0, 0) = kf.errorCovPost.at<double>(1, 1) = cfg_.measurement_noise;
    kf.errorCovPost.at<double>(2, 2) = kf.errorCovPost.at<double>(3, 3) = 100.0;
    kf.measurementNoiseCov = cv::Mat::eye(2, 2, CV_64F) * cfg_.measurement_noise;
    set_Q(kf, 1.0);

    return kf;
}

// -------- Tracker implementation ------------

Tracker::Tracker(const TrackerConfig& cfg)
    : cfg_(cfg) {}

double Tracker::cost(const Track& t, const ProjectedDetection& d) const
{
    double c = cfg_.distance_weight * cv::norm(d.pitch - t.position);
    double area = d.det.area();
    if (cfg_.size_weight > 0.0 && area > 0.0 && t.last_area > 0.0)
        c += cfg_.size_weight * fabs(log(area / t.last_area));
    return c;
}

void Tracker::predict(Track& t, double ts) const
{
    double dt = ts - t.filter_ts;
    if (dt <= 0.0) return;
    set_F(t.kf, dt);
    set_Q(t.kf, dt);
    cv::Mat pred = t.kf.predict();
    t.position = {pred.at<double>(0), pred.at<double>(1)};
    t.velocity = {pred.at<double>(2), pred.at<double>(3)};
    t.filter_ts = ts;
}

void Tracker::update(Track& t, const ProjectedDetection& d, long frame, double ts) const
{
    cv::Mat meas = (cv::Mat_<double>(2, 1) << d.pitch.x, d.pitch.y);
    cv::Mat corr = t.kf.correct(meas);
    t.position = {corr.at<double>(0), corr.at<double>(1)};
    t.velocity = {corr.at<double>(2), corr.at<double>(3)};
    t.filter_ts = ts;
    t.last_ts = ts;
    int missed = t.time_since_update;
    t.time_since_update = 0;
    t.active_streak++;
    t.status = TrackStatus::Active;
    if (d.det.area() > 0.0) t.last_area = d.det.area();
    if (d.det.team != kUnknownTeam) {
        t.team_votes[d.det.team]++;
        t.last_team = d.det.team;
    }
    t.samples.push_back({frame, ts, d.pitch, d.pixel, d.det.confidence, missed});
}

void Tracker::miss(Track& t, double ts) const
{
    t.time_since_update++;
    t.active_streak = 0;
    if (t.time_since_update > cfg_.max_coast_frames) {
        t.status = TrackStatus::Lost;
        t.lost_ts = ts;
    } else {
        t.status = TrackStatus::Coasting;
    }
}

Track& Tracker::spawn(const ProjectedDetection& d, long frame, double ts)
{
    Track& t = store_.create(d.det.cls);
    t.kf = create_kf(d.pitch);
    t.position = d.pitch;
    t.created_ts = ts;
    t.filter_ts = ts;
    t.last_ts = ts;
    t.status = TrackStatus::Active;
    t.active_streak = 1;
    t.last_area = d.det.area();
    if (d.det.team != kUnknownTeam) {
        t.team_votes[d.det.team]++;
        t.last_team = d.det.team;
    }
    t.samples.push_back({frame, ts, d.pitch, d.pixel, d.det.confidence});
    return t;
}

void Tracker::associate(DetectionClass cls, const vector<const ProjectedDetection*>& dets,
                        long frame, double ts)
{
    vector<int> ids = store_.live_ids(cls);
    int nT = int(ids.size()), nD = int(dets.size());

    // Incumbency: longer ACTIVE streak gets the smaller tie-break bias
    vector<int> order(nT);
    iota(order.begin(), order.end(), 0);
    stable_sort(order.begin(), order.end(), [&](int a, int b) {
        return store_.find(ids[a])->active_streak > store_.find(ids[b])->active_streak;
    });
    vector<double> bias(nT, 0.0);
    for (int rank = 0; rank < nT; ++rank)
        bias[order[rank]] = rank * 1e-9 * cfg_.gating_distance;

    vector<vector<double>> cost_m(nT, vector<double>(nD, 0.0));
    for (int ti = 0; ti < nT; ++ti)
        for (int di = 0; di < nD; ++di)
            cost_m[ti][di] = cost(*store_.find(ids[ti]), *dets[di]);

    vector<int> assign = solve_assignment(cost_m, cfg_.gating_distance, bias);

    vector<char> det_used(nD, false);
    for (int ti = 0; ti < nT; ++ti) {
        Track& t = *store_.find(ids[ti]);
        int di = assign[ti];
        if (di >= 0) {
            update(t, *dets[di], frame, ts);
            det_used[di] = true;
        } else {
            miss(t, ts);
        }
    }

    // Unmatched detections become new tracks
    for (int di = 0; di < nD; ++di)
        if (!det_used[di]) spawn(*dets[di], frame, ts);
}

void Tracker::step_ball(const vector<const ProjectedDetection*>& dets, long frame, double ts)
{
    // One ball identity: the most confident candidate wins, the rest is noise
    const ProjectedDetection* best = nullptr;
    for (const auto* d : dets)
        if (!best || d->det.confidence > best->det.confidence) best = d;

    Track* ball = ball_id_ >= 0 ? store_.find(ball_id_) : nullptr;
    if (ball && !ball->live()) ball = nullptr;

    if (!ball) {
        ball_id_ = best ? spawn(*best, frame, ts).id : -1;
        return;
    }

    double c = best ? cfg_.distance_weight * cv::norm(best->pitch - ball->position) : 0.0;
    if (best && c <= cfg_.ball_gating_distance) {
        update(*ball, *best, frame, ts);
    } else {
        miss(*ball, ts);
        if (!ball->live()) ball_id_ = best ? spawn(*best, frame, ts).id : -1;
    }
}

FrameSnapshot Tracker::step(long frame, double ts, const vector<ProjectedDetection>& dets)
{
    // Predict all tracks forward in time
    for (auto& [id, tr] : store_.all())
        if (tr.live()) predict(tr, ts);

    vector<const ProjectedDetection*> players, keepers, referees, balls;
    for (const auto& d : dets) {
        switch (d.det.cls) {
            case DetectionClass::Player:
                if (d.det.confidence >= cfg_.min_confidence) players.push_back(&d);
                break;
            case DetectionClass::Goalkeeper:
                if (d.det.confidence >= cfg_.min_confidence) keepers.push_back(&d);
                break;
            case DetectionClass::Referee:
                if (d.det.confidence >= cfg_.min_confidence) referees.push_back(&d);
                break;
            case DetectionClass::Ball:
                if (d.det.confidence >= cfg_.ball_min_confidence) balls.push_back(&d);
                break;
        }
    }

    associate(DetectionClass::Player, players, frame, ts);
    associate(DetectionClass::Goalkeeper, keepers, frame, ts);
    associate(DetectionClass::Referee, referees, frame, ts);
    step_ball(balls, frame, ts);

    FrameSnapshot snap;
    snap.frame = frame;
    snap.ts = ts;
    for (const auto& [id, t] : store_.all())
        if (t.live())
            snap.entries.push_back({id, t.cls, t.team(), t.status, t.position, t.uncertainty()});
    return snap;
}
