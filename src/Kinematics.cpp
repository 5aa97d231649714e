#include "Kinematics.hpp"
#include <algorithm>
#include <cmath>

using namespace std;

const KinematicSample* KinematicProfile::at_frame(long frame) const
{
    auto it = lower_bound(samples.begin(), samples.end(), frame,
                          [](const KinematicSample& s, long f) { return s.frame < f; });
    return (it != samples.end() && it->frame == frame) ? &*it : nullptr;
}

KinematicsEngine::KinematicsEngine(const KinematicsConfig& cfg, int max_coast_frames)
    : cfg_(cfg), max_coast_frames_(max_coast_frames) {}

// Even windows behave as the next odd size
vector<cv::Point2d> KinematicsEngine::smooth(const vector<cv::Point2d>& pts, int window)
{
    int n = int(pts.size());
    int half = max(window, 1) / 2;
    vector<cv::Point2d> out(n);
    for (int i = 0; i < n; ++i) {
        int h = min({half, i, n - 1 - i});
        cv::Point2d sum(0, 0);
        for (int j = i - h; j <= i + h; ++j) sum += pts[j];
        out[i] = sum * (1.0 / (2 * h + 1));
    }
    return out;
}

KinematicProfile KinematicsEngine::profile(const vector<TrackSample>& history) const
{
    KinematicProfile prof;
    KinematicSummary& sum = prof.summary;
    if (history.empty()) return prof;

    // Split into segments at gaps the tracker could not have coasted over,
    // counted in tracker steps rather than frame indices
    vector<pair<size_t, size_t>> segments;     // [begin, end)
    size_t begin = 0;
    for (size_t i = 1; i < history.size(); ++i) {
        if (history[i].missed > max_coast_frames_) {
            segments.emplace_back(begin, i);
            begin = i;
            sum.excluded_gaps++;
        }
    }
    segments.emplace_back(begin, history.size());

    double distance = 0.0;
    int seg_no = 0;
    for (auto [b, e] : segments) {
        vector<cv::Point2d> raw;
        for (size_t i = b; i < e; ++i) raw.push_back(history[i].pitch);
        vector<cv::Point2d> sm = smooth(raw, cfg_.smoothing_window);

        for (size_t i = b; i < e; ++i) {
            KinematicSample k;
            k.frame = history[i].frame;
            k.ts = history[i].ts;
            k.position = sm[i - b];
            k.segment = seg_no;

            if (i > b) {
                const KinematicSample& prev = prof.samples.back();
                double dt = k.ts - prev.ts;
                if (dt > 0.0) {
                    cv::Point2d d = k.position - prev.position;
                    double step = cv::norm(d);
                    k.velocity = d * (1.0 / dt);
                    k.speed = step / dt;
                    if (i > b + 1) k.acceleration = (k.speed - prev.speed) / dt;
                    distance += step;

                    sum.moving_time += dt;
                    if (k.speed > cfg_.high_intensity_speed) sum.high_intensity_distance += step;
                    if      (k.speed <= cfg_.walk_speed) sum.zones.walking   += dt;
                    else if (k.speed <= cfg_.jog_speed)  sum.zones.jogging   += dt;
                    else if (k.speed <= cfg_.run_speed)  sum.zones.running   += dt;
                    else                                 sum.zones.sprinting += dt;

                    sum.max_speed = max(sum.max_speed, k.speed);
                    sum.max_acceleration = max(sum.max_acceleration, fabs(k.acceleration));
                }
            }
            k.distance = distance;
            prof.samples.push_back(k);
        }
        seg_no++;
    }

    sum.total_distance = distance;
    if (sum.moving_time > 0.0) {
        sum.avg_speed = distance / sum.moving_time;
        sum.zones.walking   *= 100.0 / sum.moving_time;
        sum.zones.jogging   *= 100.0 / sum.moving_time;
        sum.zones.running   *= 100.0 / sum.moving_time;
        sum.zones.sprinting *= 100.0 / sum.moving_time;
    }

    sum.sprints = find_sprints(prof.samples);
    for (const auto& s : sum.sprints) sum.sprint_distance += s.distance;
    return prof;
}

// A sprint is a run of intervals above sprint speed lasting at least the minimum duration
vector<Sprint> KinematicsEngine::find_sprints(const vector<KinematicSample>& s) const
{
    vector<Sprint> out;
    bool in_sprint = false;
    Sprint cur;

    auto close = [&]() {
        if (in_sprint && cur.duration() >= cfg_.sprint_min_duration) out.push_back(cur);
        in_sprint = false;
    };

    for (size_t i = 1; i < s.size(); ++i) {
        bool bridged = s[i].segment == s[i - 1].segment;
        bool fast = bridged && s[i].speed > cfg_.sprint_speed;
        if (!fast) {
            close();
            continue;
        }
        if (!in_sprint) {
            in_sprint = true;
            cur = Sprint{};
            cur.start = s[i - 1].ts;
        }
        cur.end = s[i].ts;
        cur.peak_speed = max(cur.peak_speed, s[i].speed);
        cur.distance += s[i].distance - s[i - 1].distance;
    }
    close();
    return out;
}
