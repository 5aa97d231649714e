#include "JsonIO.hpp"
#include <cctype>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace std;
using nlohmann::ordered_json;

// -----------------------------------------------------------------------------
// ISO-8601 timestamp <-> seconds since epoch

double parse_iso(const string& s)
{
    tm tm{};
    double frac = 0.0;
    istringstream ss(s);
    ss >> get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) throw runtime_error("not an ISO-8601 timestamp: " + s);
    if (ss.peek() == '.') {
        ss.get();
        string digits;
        while (isdigit(ss.peek())) digits += char(ss.get());
        if (!digits.empty()) frac = stod("0." + digits);
    }
    return double(timegm(&tm)) + frac;
}

string format_iso(double sec)
{
    double whole = floor(sec);
    time_t t_int = static_cast<time_t>(whole);
    int micros = int((sec - whole) * 1e6 + 0.5);
    if (micros >= 1000000) {
        t_int += 1;
        micros -= 1000000;
    }
    tm tm{};
    gmtime_r(&t_int, &tm);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    ostringstream out;
    out << buf << '.' << setw(6) << setfill('0') << micros;
    return out.str();
}

// -----------------------------------------------------------------------------
// detection stream

static Detection parse_detection(const ordered_json& d)
{
    auto cls = parse_detection_class(d.at("class").get<string>());
    if (!cls) throw runtime_error("unknown class '" + d.at("class").get<string>() + "'");

    Detection det;
    det.cls = *cls;
    det.x = d.at("x").get<double>();
    det.y = d.at("y").get<double>();
    det.w = d.value("w", 0.0);
    det.h = d.value("h", 0.0);
    det.confidence = d.value("confidence", 1.0);
    if (d.contains("team") && !d.at("team").is_null()) det.team = d.at("team").get<int>();
    return det;
}

FrameBatch parse_frame(const ordered_json& f, long index, bool* iso)
{
    FrameBatch b;
    b.frame = f.value("frame", index);

    const auto& ts = f.at("timestamp");
    if (ts.is_string()) {
        b.ts = parse_iso(ts.get<string>());
        if (iso) *iso = true;
    } else {
        b.ts = ts.get<double>();
    }

    if (!f.contains("detections")) return b;
    for (const auto& d : f.at("detections")) {
        try {
            b.dets.push_back(parse_detection(d));
        } catch (const exception& e) {
            // the frame is dropped as a whole, keep decoding the stream
            b.malformed = string("undecodable detection: ") + e.what();
            b.dets.clear();
            break;
        }
    }
    return b;
}

JsonDetectionSource::JsonDetectionSource(const string& path)
{
    ifstream in(path);
    if (!in.is_open()) throw runtime_error("cannot open " + path);
    ordered_json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw runtime_error(path + ": " + e.what());
    }
    load(j);
}

JsonDetectionSource JsonDetectionSource::from_json(const ordered_json& frames)
{
    JsonDetectionSource src;
    src.load(frames);
    return src;
}

void JsonDetectionSource::load(const ordered_json& j)
{
    if (!j.is_array()) throw runtime_error("detection stream must be a JSON array of frames");
    frames_.reserve(j.size());
    long index = 0;
    for (const auto& f : j) {
        try {
            frames_.push_back(parse_frame(f, index++, &iso_));
        } catch (const exception& e) {
            throw runtime_error("frame " + std::to_string(index - 1) + ": " + e.what());
        }
    }
}

optional<FrameBatch> JsonDetectionSource::next()
{
    if (pos_ >= frames_.size()) return nullopt;
    return move(frames_[pos_++]);
}

// -----------------------------------------------------------------------------
// report

static ordered_json ts_json(double ts, bool iso)
{
    if (iso) return format_iso(ts);
    return ts;
}

static ordered_json point_json(const cv::Point2d& p)
{
    return ordered_json::array({p.x, p.y});
}

static ordered_json kinematics_json(const KinematicSummary& k, bool iso)
{
    ordered_json sprints = ordered_json::array();
    for (const auto& s : k.sprints)
        sprints.push_back({{"start", ts_json(s.start, iso)},
                           {"end", ts_json(s.end, iso)},
                           {"duration", s.duration()},
                           {"peak_speed", s.peak_speed},
                           {"distance", s.distance}});

    return {{"total_distance", k.total_distance},
            {"high_intensity_distance", k.high_intensity_distance},
            {"sprint_distance", k.sprint_distance},
            {"avg_speed", k.avg_speed},
            {"max_speed", k.max_speed},
            {"max_acceleration", k.max_acceleration},
            {"moving_time", k.moving_time},
            {"excluded_gaps", k.excluded_gaps},
            {"speed_zones", {{"walking", k.zones.walking},
                             {"jogging", k.zones.jogging},
                             {"running", k.zones.running},
                             {"sprinting", k.zones.sprinting}}},
            {"sprints", sprints}};
}

static ordered_json event_json(const Event& e, bool iso)
{
    ordered_json o;
    o["type"] = to_string(e.type);
    o["timestamp"] = ts_json(e.ts, iso);
    o["resolved"] = ts_json(e.resolved_ts, iso);
    o["frame"] = e.frame;
    o["team"] = e.team;
    o["ball_track"] = e.ball_track;
    o["evidence_tracks"] = e.evidence_tracks;

    switch (e.type) {
        case EventType::Pass:
            o["from"] = e.pass.from;
            o["to"] = e.pass.to;
            o["outcome"] = to_string(e.pass.outcome);
            o["length"] = e.pass.length;
            o["length_class"] = to_string(e.pass.length_class);
            o["direction"] = to_string(e.pass.direction);
            break;
        case EventType::Shot:
            o["by"] = e.shot.by;
            o["on_target"] = e.shot.on_target;
            o["outcome"] = to_string(e.shot.outcome);
            o["origin"] = point_json(e.shot.origin);
            break;
        case EventType::Goal:
            o["by"] = e.goal.by;
            break;
        case EventType::PossessionChange:
            o["from_team"] = e.change.from_team;
            o["to_team"] = e.change.to_team;
            o["gained_by"] = e.change.gained_by;
            break;
    }
    return o;
}

static ordered_json technical_json(const TeamTechnical& t)
{
    return {{"passes", t.passes},
            {"completed", t.completed},
            {"intercepted", t.intercepted},
            {"pass_accuracy", t.pass_accuracy},
            {"pass_length", {{"short", t.short_passes},
                             {"medium", t.medium_passes},
                             {"long", t.long_passes}}},
            {"pass_direction", {{"forward", t.forward},
                                {"backward", t.backward},
                                {"lateral", t.lateral}}},
            {"shots", t.shots},
            {"on_target", t.on_target},
            {"shot_accuracy", t.shot_accuracy},
            {"goals", t.goals},
            {"possessions_won", t.possessions_won}};
}

ordered_json tactical_to_json(const TacticalSummary& t, const PitchModel& pitch, bool iso)
{
    ordered_json windows = ordered_json::array();
    for (const auto& w : t.windows) {
        ordered_json o;
        o["start"] = ts_json(w.start, iso);
        o["end"] = ts_json(w.end, iso);
        for (int team = 0; team < 2; ++team) {
            const TeamWindowSummary& s = w.teams[team];
            ordered_json zones;
            for (size_t z = 0; z < s.zone_counts.size(); ++z)
                zones[pitch.zone_name(int(z))] = s.zone_counts[z];
            o["team_" + std::to_string(team)] = {{"frames", s.frames},
                                                 {"avg_players", s.avg_players},
                                                 {"centroid", point_json(s.centroid)},
                                                 {"hull_area", s.hull_area},
                                                 {"depth", s.depth},
                                                 {"breadth", s.breadth},
                                                 {"formation", s.formation},
                                                 {"zones", zones}};
        }
        windows.push_back(o);
    }

    ordered_json o;
    o["possession"] = {{"total_time", t.possession.total_time},
                       {"team_0", {{"time", t.possession.controlled_time[0]},
                                   {"percentage", t.possession.percentage[0]}}},
                       {"team_1", {{"time", t.possession.controlled_time[1]},
                                   {"percentage", t.possession.percentage[1]}}}};
    o["windows"] = windows;
    o["heatmaps"] = {{"team_0", t.heatmaps[0]}, {"team_1", t.heatmaps[1]}};
    return o;
}

ordered_json report_to_json(const AnalysisResult& r, const PitchModel& pitch, bool iso)
{
    ordered_json j;
    j["status"] = to_string(r.completion);
    if (!r.complete()) j["abort_reason"] = r.abort_reason;
    j["frames_processed"] = r.frames_processed;
    j["frames_skipped"] = r.frames_skipped;
    j["start"] = ts_json(r.start_ts, iso);
    j["end"] = ts_json(r.end_ts, iso);

    j["tracks"] = ordered_json::array();
    for (const auto& t : r.tracks)
        j["tracks"].push_back({{"id", t.id},
                               {"class", to_string(t.cls)},
                               {"team", t.team},
                               {"status", to_string(t.status)},
                               {"first_seen", ts_json(t.first_ts, iso)},
                               {"last_seen", ts_json(t.last_ts, iso)},
                               {"samples", t.samples},
                               {"kinematics", kinematics_json(t.kinematics, iso)}});

    j["events"] = ordered_json::array();
    for (const auto& e : r.events) j["events"].push_back(event_json(e, iso));

    j["episodes"] = ordered_json::array();
    for (const auto& ep : r.episodes) {
        ordered_json spells = ordered_json::array();
        for (const auto& s : ep.spells)
            spells.push_back({{"track", s.track_id},
                              {"team", s.team},
                              {"start", ts_json(s.start, iso)},
                              {"end", ts_json(s.end, iso)}});
        j["episodes"].push_back({{"id", ep.id},
                                 {"team", ep.team},
                                 {"ball_track", ep.ball_track},
                                 {"start", ts_json(ep.start, iso)},
                                 {"end", ts_json(ep.end, iso)},
                                 {"outcome", to_string(ep.outcome)},
                                 {"spells", spells},
                                 {"events", ep.events}});
    }

    j["technical"] = {{"team_0", technical_json(r.technical[0])},
                      {"team_1", technical_json(r.technical[1])}};
    j["tactical"] = tactical_to_json(r.tactical, pitch, iso);

    j["warnings"] = ordered_json::array();
    for (const auto& w : r.warnings)
        j["warnings"].push_back({{"frame", w.frame},
                                 {"timestamp", ts_json(w.ts, iso)},
                                 {"message", w.message}});

    j["omissions"] = ordered_json::array();
    for (const auto& o : r.omissions)
        j["omissions"].push_back({{"timestamp", ts_json(o.ts, iso)}, {"reason", o.reason}});
    return j;
}
