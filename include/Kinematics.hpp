#pragma once
#include "Config.hpp"
#include "Types.hpp"
#include <opencv2/core.hpp>
#include <vector>

/** One smoothed sample with its derivatives. */
struct KinematicSample
{
    long        frame = 0;
    double      ts = 0.0;
    cv::Point2d position;                // smoothed, metres
    cv::Point2d velocity;                // m/s, over the interval ending here
    double      speed = 0.0;             // m/s
    double      acceleration = 0.0;      // m/s^2, derivative of speed
    double      distance = 0.0;          // cumulative, metres
    int         segment = 0;             // samples across a bridged gap share a segment
};

struct Sprint
{
    double start = 0.0, end = 0.0;
    double peak_speed = 0.0;
    double distance = 0.0;

    double duration() const { return end - start; }
};

struct SpeedZones                        // share of moving time, percent
{
    double walking = 0.0;
    double jogging = 0.0;
    double running = 0.0;
    double sprinting = 0.0;
};

struct KinematicSummary
{
    double total_distance = 0.0;
    double high_intensity_distance = 0.0;
    double sprint_distance = 0.0;
    double avg_speed = 0.0;
    double max_speed = 0.0;
    double max_acceleration = 0.0;
    double moving_time = 0.0;            // time covered by bridged intervals
    int    excluded_gaps = 0;            // gaps longer than the coasting budget
    SpeedZones zones;
    std::vector<Sprint> sprints;
};

struct KinematicProfile
{
    std::vector<KinematicSample> samples;
    KinematicSummary summary;

    /** Sample recorded at `frame`, or nullptr. */
    const KinematicSample* at_frame(long frame) const;
};

class KinematicsEngine
{
public:
    KinematicsEngine(const KinematicsConfig& cfg, int max_coast_frames);

    KinematicProfile profile(const std::vector<TrackSample>& history) const;

    /** Centred moving average, window shrunk symmetrically at the ends. */
    static std::vector<cv::Point2d> smooth(const std::vector<cv::Point2d>& pts, int window);

private:
    std::vector<Sprint> find_sprints(const std::vector<KinematicSample>& s) const;

    KinematicsConfig cfg_;
    int max_coast_frames_;
};
