#include "Config.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>

using namespace std;

// -------- IniFile -----------------------------------------------------------

IniFile IniFile::load(const string& path)
{
    ifstream file(path);
    if (!file.is_open()) return {};

    cout << "[config] loading " << path << endl;
    stringstream buf;
    buf << file.rdbuf();
    return parse(buf.str());
}

IniFile IniFile::parse(const string& text)
{
    IniFile ini;
    istringstream in(text);
    string line, current_section;
    regex section_re(R"(^\s*\[(.*?)\]\s*$)");
    regex keyval_re(R"(^\s*([^=#;]+?)\s*=\s*(.*?)\s*(?:[#;].*)?$)");
    smatch match;

    while (getline(in, line)) {
        if (regex_match(line, match, section_re)) {
            current_section = match[1];
        } else if (regex_match(line, match, keyval_re)) {
            ini.values_[current_section][match[1]] = match[2];
        }
    }
    return ini;
}

optional<string> IniFile::get(const string& section, const string& key) const
{
    auto s = values_.find(section);
    if (s == values_.end()) return nullopt;
    auto k = s->second.find(key);
    if (k == s->second.end() || k->second.empty()) return nullopt;
    return k->second;
}

double IniFile::get_double(const string& section, const string& key, double def) const
{
    auto v = get(section, key);
    if (!v) return def;
    try {
        size_t used = 0;
        double d = stod(*v, &used);
        if (used != v->size()) throw invalid_argument(*v);
        return d;
    } catch (const logic_error&) {
        throw ConfigError("[" + section + "] " + key + ": not a number: " + *v);
    }
}

int IniFile::get_int(const string& section, const string& key, int def) const
{
    auto v = get(section, key);
    if (!v) return def;
    try {
        size_t used = 0;
        int i = stoi(*v, &used);
        if (used != v->size()) throw invalid_argument(*v);
        return i;
    } catch (const logic_error&) {
        throw ConfigError("[" + section + "] " + key + ": not an integer: " + *v);
    }
}

bool IniFile::get_bool(const string& section, const string& key, bool def) const
{
    auto v = get(section, key);
    if (!v) return def;
    string s = *v;
    transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) { return char(tolower(ch)); });
    if (s == "true" || s == "yes" || s == "on" || s == "1") return true;
    if (s == "false" || s == "no" || s == "off" || s == "0") return false;
    throw ConfigError("[" + section + "] " + key + ": not a boolean: " + *v);
}

string IniFile::get_string(const string& section, const string& key, const string& def) const
{
    auto v = get(section, key);
    return v ? *v : def;
}

vector<double> IniFile::get_list(const string& section, const string& key) const
{
    vector<double> out;
    auto v = get(section, key);
    if (!v) return out;
    string s = *v;
    replace(s.begin(), s.end(), ',', ' ');
    istringstream in(s);
    string tok;
    while (in >> tok) {
        try {
            out.push_back(stod(tok));
        } catch (const logic_error&) {
            throw ConfigError("[" + section + "] " + key + ": not a number list: " + *v);
        }
    }
    return out;
}

void IniFile::set(const string& section, const string& key, const string& value)
{
    values_[section][key] = value;
}

// -------- PitchModel --------------------------------------------------------

int PitchModel::zone_of(const cv::Point2d& p) const
{
    int col = int(floor(p.x / length * thirds));
    int row = int(floor(p.y / width * channels));
    col = clamp(col, 0, thirds - 1);
    row = clamp(row, 0, channels - 1);
    return row * thirds + col;
}

string PitchModel::zone_name(int zone) const
{
    int col = zone % thirds, row = zone / thirds;
    if (thirds == 3 && channels == 3) {
        static const char* third_names[]   = {"left_third", "middle_third", "right_third"};
        static const char* channel_names[] = {"top", "centre", "bottom"};
        return string(third_names[col]) + "/" + channel_names[row];
    }
    return "zone_" + to_string(col) + "_" + to_string(row);
}

bool PitchModel::inside(const cv::Point2d& p, double margin) const
{
    return p.x >= -margin && p.x <= length + margin &&
           p.y >= -margin && p.y <= width + margin;
}

int PitchModel::goal_side(const cv::Point2d& p) const
{
    if (fabs(p.y - width * 0.5) > goal_width * 0.5) return 0;
    if (p.x <= 0.0 && p.x >= -goal_depth) return -1;
    if (p.x >= length && p.x <= length + goal_depth) return 1;
    return 0;
}

// -------- PipelineConfig ----------------------------------------------------

static array<cv::Point2d, 4> read_points(const IniFile& ini, const string& key)
{
    vector<double> v = ini.get_list("calibration", key);
    if (v.size() != 8)
        throw ConfigError("[calibration] " + key + ": expected 8 numbers, got " +
                          to_string(v.size()));
    array<cv::Point2d, 4> pts;
    for (int i = 0; i < 4; ++i) pts[i] = {v[2 * i], v[2 * i + 1]};
    return pts;
}

PipelineConfig PipelineConfig::from_ini(const IniFile& ini)
{
    PipelineConfig c;

    int capacity = ini.get_int("pipeline", "queue-capacity", int(c.queue_capacity));
    if (capacity <= 0) throw ConfigError("[pipeline] queue-capacity must be positive");
    c.queue_capacity = size_t(capacity);

    auto& p = c.pitch;
    p.length            = ini.get_double("pitch", "length", p.length);
    p.width             = ini.get_double("pitch", "width", p.width);
    p.goal_width        = ini.get_double("pitch", "goal-width", p.goal_width);
    p.goal_depth        = ini.get_double("pitch", "goal-depth", p.goal_depth);
    p.goal_region_width = ini.get_double("pitch", "goal-region-width", p.goal_region_width);
    p.thirds            = ini.get_int("pitch", "thirds", p.thirds);
    p.channels          = ini.get_int("pitch", "channels", p.channels);

    auto& cal = c.calibration;
    cal.setup        = ini.get_string("calibration", "setup", cal.setup);
    cal.frame_width  = ini.get_double("calibration", "frame-width", cal.frame_width);
    cal.frame_height = ini.get_double("calibration", "frame-height", cal.frame_height);
    string mode = ini.get_string("calibration", "mode", "fixed-pitch");
    if (mode == "fixed-pitch") {
        cal.mode = CalibrationMode::FixedPitch;
    } else if (mode == "homography") {
        cal.mode = CalibrationMode::Homography;
        vector<double> h = ini.get_list("calibration", "homography");
        if (h.size() != 9)
            throw ConfigError("[calibration] homography: expected 9 numbers, got " +
                              to_string(h.size()));
        for (int i = 0; i < 9; ++i) cal.homography.val[i] = h[i];
    } else if (mode == "reference-points") {
        cal.mode = CalibrationMode::ReferencePoints;
        cal.pixel_points = read_points(ini, "pixel-points");
        cal.pitch_points = read_points(ini, "pitch-points");
    } else {
        throw ConfigError("[calibration] mode: unknown value " + mode);
    }

    auto& t = c.tracker;
    t.gating_distance      = ini.get_double("tracker", "max-dist", t.gating_distance);
    t.distance_weight      = ini.get_double("tracker", "distance-weight", t.distance_weight);
    t.size_weight          = ini.get_double("tracker", "size-weight", t.size_weight);
    t.max_coast_frames     = ini.get_int("tracker", "max-coast-frames", t.max_coast_frames);
    t.min_confidence       = ini.get_double("tracker", "min-confidence", t.min_confidence);
    t.ball_min_confidence  = ini.get_double("tracker", "ball-min-confidence", t.ball_min_confidence);
    t.ball_gating_distance = ini.get_double("tracker", "ball-max-dist", t.ball_gating_distance);
    t.process_noise        = ini.get_double("tracker", "process-noise", t.process_noise);
    t.measurement_noise    = ini.get_double("tracker", "measurement-noise", t.measurement_noise);

    auto& k = c.kinematics;
    k.smoothing_window     = ini.get_int("kinematics", "smoothing-window", k.smoothing_window);
    k.sprint_speed         = ini.get_double("kinematics", "sprint-speed", k.sprint_speed);
    k.sprint_min_duration  = ini.get_double("kinematics", "sprint-min-duration", k.sprint_min_duration);
    k.high_intensity_speed = ini.get_double("kinematics", "high-intensity-speed", k.high_intensity_speed);
    k.walk_speed           = ini.get_double("kinematics", "walk-speed", k.walk_speed);
    k.jog_speed            = ini.get_double("kinematics", "jog-speed", k.jog_speed);
    k.run_speed            = ini.get_double("kinematics", "run-speed", k.run_speed);

    auto& e = c.events;
    e.control_radius            = ini.get_double("events", "control-radius", e.control_radius);
    e.control_speed             = ini.get_double("events", "control-speed", e.control_speed);
    e.kick_speed                = ini.get_double("events", "kick-speed", e.kick_speed);
    e.kick_direction_cos        = ini.get_double("events", "kick-direction-cos", e.kick_direction_cos);
    e.kick_confirm_frames       = ini.get_int("events", "kick-confirm-frames", e.kick_confirm_frames);
    e.direction_consistency_cos = ini.get_double("events", "direction-consistency-cos",
                                                 e.direction_consistency_cos);
    e.ambiguity_span            = ini.get_double("events", "ambiguity-span", e.ambiguity_span);
    e.transit_timeout           = ini.get_double("events", "transit-timeout", e.transit_timeout);
    e.max_shot_distance         = ini.get_double("events", "max-shot-distance", e.max_shot_distance);
    e.out_margin                = ini.get_double("events", "out-margin", e.out_margin);
    e.team0_attacks_right       = ini.get_bool("events", "team0-attacks-right", e.team0_attacks_right);

    auto& tac = c.tactical;
    tac.window       = ini.get_double("tactical", "window", tac.window);
    tac.stride       = ini.get_double("tactical", "stride", tac.stride);
    tac.heatmap_cols = ini.get_int("tactical", "heatmap-cols", tac.heatmap_cols);
    tac.heatmap_rows = ini.get_int("tactical", "heatmap-rows", tac.heatmap_rows);
    tac.line_gap     = ini.get_double("tactical", "line-gap", tac.line_gap);

    return c;
}

void PipelineConfig::validate() const
{
    auto require = [](bool ok, const string& what) {
        if (!ok) throw ConfigError("invalid configuration: " + what);
    };

    require(queue_capacity > 0, "queue-capacity must be positive");
    require(pitch.length > 0 && pitch.width > 0, "pitch dimensions must be positive");
    require(pitch.goal_width > 0 && pitch.goal_width < pitch.width, "goal-width out of range");
    require(pitch.goal_depth > 0, "goal-depth must be positive");
    require(pitch.goal_region_width >= pitch.goal_width, "goal-region-width below goal-width");
    require(pitch.thirds > 0 && pitch.channels > 0, "zone partition must be non-empty");
    require(calibration.frame_width > 0 && calibration.frame_height > 0,
            "frame size must be positive");

    require(tracker.gating_distance > 0, "max-dist must be positive");
    require(tracker.ball_gating_distance > 0, "ball-max-dist must be positive");
    require(tracker.distance_weight > 0, "distance-weight must be positive");
    require(tracker.size_weight >= 0, "size-weight must not be negative");
    require(tracker.max_coast_frames >= 0, "max-coast-frames must not be negative");
    require(tracker.min_confidence >= 0 && tracker.min_confidence <= 1,
            "min-confidence outside [0,1]");
    require(tracker.ball_min_confidence >= 0 && tracker.ball_min_confidence <= 1,
            "ball-min-confidence outside [0,1]");
    require(tracker.process_noise > 0 && tracker.measurement_noise > 0,
            "filter noise must be positive");

    require(kinematics.smoothing_window >= 1, "smoothing-window must be at least 1");
    require(kinematics.sprint_speed > 0, "sprint-speed must be positive");
    require(kinematics.sprint_min_duration >= 0, "sprint-min-duration must not be negative");
    require(kinematics.walk_speed < kinematics.jog_speed &&
            kinematics.jog_speed < kinematics.run_speed, "speed zones must increase");

    require(events.control_radius > 0, "control-radius must be positive");
    require(events.control_speed > 0 && events.control_speed < events.kick_speed,
            "control-speed must be positive and below kick-speed");
    require(events.kick_confirm_frames >= 1, "kick-confirm-frames must be at least 1");
    require(events.transit_timeout > 0, "transit-timeout must be positive");
    require(events.ambiguity_span > 0, "ambiguity-span must be positive");
    require(events.out_margin >= 0, "out-margin must not be negative");

    require(tactical.window > 0, "tactical window must be positive");
    require(tactical.stride >= 0 && tactical.stride <= tactical.window,
            "tactical stride must lie in [0, window]");
    require(tactical.heatmap_cols > 0 && tactical.heatmap_rows > 0, "heat map must be non-empty");
    require(tactical.line_gap > 0, "line-gap must be positive");
}
