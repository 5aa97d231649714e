#pragma once
#include <opencv2/core.hpp>
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

// ─── INI reader ─────────────────────────────────────────────────────────────

class IniFile
{
public:
    IniFile() = default;

    /** Parse an .ini file. A missing file yields an empty IniFile. */
    static IniFile load(const std::string& path);
    static IniFile parse(const std::string& text);

    std::optional<std::string> get(const std::string& section,
                                   const std::string& key) const;

    double      get_double(const std::string& section, const std::string& key, double def) const;
    int         get_int(const std::string& section, const std::string& key, int def) const;
    bool        get_bool(const std::string& section, const std::string& key, bool def) const;
    std::string get_string(const std::string& section, const std::string& key,
                           const std::string& def) const;
    /** Comma or whitespace separated list of numbers. */
    std::vector<double> get_list(const std::string& section, const std::string& key) const;

    void set(const std::string& section, const std::string& key, const std::string& value);
    bool empty() const { return values_.empty(); }

private:
    std::map<std::string, std::map<std::string, std::string>> values_;
};

// ─── pitch model (read-only after construction) ─────────────────────────────

struct PitchModel
{
    double length = 105.0;               // x axis, metres
    double width  = 68.0;                // y axis, metres
    double goal_width = 7.32;
    double goal_depth = 2.0;
    double goal_region_width = 40.32;    // penalty-area width, where shots aim
    int    thirds   = 3;                 // along the length
    int    channels = 3;                 // across the width

    int  zone_count() const { return thirds * channels; }
    /** Zone index for a pitch position; positions off the pitch clamp to the edge zone. */
    int  zone_of(const cv::Point2d& p) const;
    std::string zone_name(int zone) const;

    bool inside(const cv::Point2d& p, double margin = 0.0) const;
    /** -1 for the goal at x = 0, +1 for the goal at x = length, 0 otherwise. */
    int  goal_side(const cv::Point2d& p) const;
};

// ─── per-component configuration ────────────────────────────────────────────

enum class CalibrationMode
{
    FixedPitch,         // video frame stretched onto the pitch
    Homography,         // explicit 3x3 matrix
    ReferencePoints     // four pixel/pitch correspondences
};

struct CalibrationConfig
{
    CalibrationMode mode = CalibrationMode::FixedPitch;
    std::string     setup = "default";   // camera setup key for the cache
    double frame_width  = 1920.0;
    double frame_height = 1080.0;
    cv::Matx33d homography = cv::Matx33d::eye();
    std::array<cv::Point2d, 4> pixel_points{};
    std::array<cv::Point2d, 4> pitch_points{};
};

struct TrackerConfig
{
    double gating_distance = 3.0;        // max association cost, inclusive
    double distance_weight = 1.0;
    double size_weight     = 0.0;        // weight of |ln(area ratio)|
    int    max_coast_frames = 15;
    double min_confidence = 0.3;
    double ball_min_confidence = 0.5;
    double ball_gating_distance = 8.0;
    double process_noise = 1.0;
    double measurement_noise = 0.25;
};

struct KinematicsConfig
{
    int    smoothing_window = 5;         // samples, odd
    double sprint_speed = 7.0;           // m/s
    double sprint_min_duration = 1.0;    // s
    double high_intensity_speed = 5.5;   // m/s
    double walk_speed = 2.0;
    double jog_speed  = 4.0;
    double run_speed  = 7.0;
};

struct EventConfig
{
    double control_radius = 1.5;         // m
    double control_speed = 3.0;          // m/s, ball slower than this can be controlled
    double kick_speed = 6.0;             // m/s
    double kick_direction_cos = 0.5;     // ball heading vs. away-from-controller
    int    kick_confirm_frames = 2;
    double direction_consistency_cos = 0.8;
    double ambiguity_span = 0.5;         // s between control and kick speed
    double transit_timeout = 3.0;        // s without a receiver
    double max_shot_distance = 35.0;     // m from the goal line
    double out_margin = 0.5;             // m beyond a line before it counts as crossed
    bool   team0_attacks_right = true;
};

struct TacticalConfig
{
    double window = 60.0;                // s
    double stride = 0.0;                 // s between window starts, 0 = window length
    int    heatmap_cols = 10;
    int    heatmap_rows = 10;
    double line_gap = 6.0;               // m between outfield lines
};

struct PipelineConfig
{
    PitchModel        pitch;
    CalibrationConfig calibration;
    TrackerConfig     tracker;
    KinematicsConfig  kinematics;
    EventConfig       events;
    TacticalConfig    tactical;
    size_t            queue_capacity = 64;

    static PipelineConfig from_ini(const IniFile& ini);
    /** Throws ConfigError on values no component can work with. */
    void validate() const;
};
