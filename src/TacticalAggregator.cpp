#include "TacticalAggregator.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>

using namespace std;

static bool is_outfield_or_keeper(const SnapshotEntry& e)
{
    return (e.cls == DetectionClass::Player || e.cls == DetectionClass::Goalkeeper) &&
           (e.team == 0 || e.team == 1);
}

TacticalAggregator::TacticalAggregator(const TacticalConfig& cfg, const PitchModel& pitch,
                                       bool team0_attacks_right)
    : cfg_(cfg), pitch_(pitch), team0_attacks_right_(team0_attacks_right) {}

string TacticalAggregator::formation(const vector<cv::Point2d>& outfield, int team) const
{
    if (outfield.size() < 2) return "";

    // Depth along the team's attacking direction, defence first
    double sign = ((team == 0) == team0_attacks_right_) ? 1.0 : -1.0;
    vector<double> depth;
    for (const auto& p : outfield) depth.push_back(p.x * sign);
    sort(depth.begin(), depth.end());

    vector<int> lines{1};
    for (size_t i = 1; i < depth.size(); ++i) {
        if (depth[i] - depth[i - 1] > cfg_.line_gap) lines.push_back(1);
        else lines.back()++;
    }

    ostringstream out;
    for (size_t i = 0; i < lines.size(); ++i) out << (i ? "-" : "") << lines[i];
    return out.str();
}

TacticalWindow TacticalAggregator::summarise(double start, double end,
                                             const vector<const FrameSnapshot*>& frames) const
{
    TacticalWindow w;
    w.start = start;
    w.end = end;

    array<map<int, pair<cv::Point2d, int>>, 2> track_sums;   // outfield mean positions
    array<int, 2> hull_frames{};

    for (int team = 0; team < 2; ++team)
        w.teams[team].zone_counts.assign(pitch_.zone_count(), 0);

    for (const FrameSnapshot* f : frames) {
        array<vector<cv::Point2f>, 2> pts;
        for (const auto& e : f->entries) {
            if (!is_outfield_or_keeper(e)) continue;
            pts[e.team].emplace_back(float(e.position.x), float(e.position.y));
            w.teams[e.team].zone_counts[pitch_.zone_of(e.position)]++;
            if (e.cls == DetectionClass::Player) {
                auto& s = track_sums[e.team][e.track_id];
                s.first += e.position;
                s.second++;
            }
        }

        for (int team = 0; team < 2; ++team) {
            const auto& p = pts[team];
            if (p.empty()) continue;
            TeamWindowSummary& t = w.teams[team];
            t.frames++;
            t.avg_players += double(p.size());

            cv::Point2d c(0, 0);
            float minx = p[0].x, maxx = p[0].x, miny = p[0].y, maxy = p[0].y;
            for (const auto& q : p) {
                c += cv::Point2d(q.x, q.y);
                minx = min(minx, q.x); maxx = max(maxx, q.x);
                miny = min(miny, q.y); maxy = max(maxy, q.y);
            }
            t.centroid += c * (1.0 / double(p.size()));
            t.depth += maxx - minx;
            t.breadth += maxy - miny;

            if (p.size() >= 3) {
                vector<cv::Point2f> hull;
                cv::convexHull(p, hull);
                t.hull_area += cv::contourArea(hull);
                hull_frames[team]++;
            }
        }
    }

    for (int team = 0; team < 2; ++team) {
        TeamWindowSummary& t = w.teams[team];
        if (t.frames > 0) {
            double n = double(t.frames);
            t.avg_players /= n;
            t.centroid *= 1.0 / n;
            t.depth /= n;
            t.breadth /= n;
        }
        if (hull_frames[team] > 0) t.hull_area /= double(hull_frames[team]);

        vector<cv::Point2d> outfield;
        for (const auto& [id, s] : track_sums[team])
            outfield.push_back(s.first * (1.0 / double(s.second)));
        t.formation = formation(outfield, team);
    }
    return w;
}

array<HeatMap, 2> TacticalAggregator::heatmaps(const vector<FrameSnapshot>& snapshots) const
{
    array<HeatMap, 2> maps;
    for (auto& m : maps) m.assign(cfg_.heatmap_rows, vector<double>(cfg_.heatmap_cols, 0.0));

    for (const auto& f : snapshots)
        for (const auto& e : f.entries) {
            if (!is_outfield_or_keeper(e)) continue;
            int col = int(e.position.x / pitch_.length * cfg_.heatmap_cols);
            int row = int(e.position.y / pitch_.width * cfg_.heatmap_rows);
            col = clamp(col, 0, cfg_.heatmap_cols - 1);
            row = clamp(row, 0, cfg_.heatmap_rows - 1);
            maps[e.team][row][col] += 1.0;
        }

    for (auto& m : maps) {
        double peak = 0.0;
        for (const auto& r : m) peak = max(peak, *max_element(r.begin(), r.end()));
        if (peak > 0.0)
            for (auto& r : m)
                for (auto& v : r) v /= peak;
    }
    return maps;
}

PossessionStats TacticalAggregator::possession(const vector<FrameSnapshot>& snapshots,
                                               const vector<PossessionEpisode>& episodes) const
{
    PossessionStats p;
    if (!snapshots.empty()) p.total_time = snapshots.back().ts - snapshots.front().ts;

    for (const auto& ep : episodes)
        for (const auto& s : ep.spells)
            if (s.team == 0 || s.team == 1) p.controlled_time[s.team] += s.end - s.start;

    if (p.total_time > 0.0)
        for (int team = 0; team < 2; ++team)
            p.percentage[team] = p.controlled_time[team] / p.total_time * 100.0;
    return p;
}

TacticalSummary TacticalAggregator::aggregate(const vector<FrameSnapshot>& snapshots,
                                              const vector<PossessionEpisode>& episodes) const
{
    TacticalSummary out;
    out.possession = possession(snapshots, episodes);
    out.heatmaps = heatmaps(snapshots);
    if (snapshots.empty()) return out;

    // Windows of `window` seconds starting every `stride` seconds
    double t0 = snapshots.front().ts, t_last = snapshots.back().ts;
    double stride = cfg_.stride > 0.0 ? cfg_.stride : cfg_.window;
    auto by_ts = [](const FrameSnapshot& s, double t) { return s.ts < t; };
    for (long k = 0;; ++k) {
        double start = t0 + k * stride;
        double end = start + cfg_.window;
        auto first = lower_bound(snapshots.begin(), snapshots.end(), start, by_ts);
        auto last = lower_bound(first, snapshots.end(), end, by_ts);
        vector<const FrameSnapshot*> frames;
        for (auto it = first; it != last; ++it) frames.push_back(&*it);
        if (!frames.empty())
            out.windows.push_back(summarise(start, min(end, t_last), frames));
        if (end > t_last) break;
    }
    return out;
}
