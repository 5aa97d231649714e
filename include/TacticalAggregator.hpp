#pragma once
#include "Config.hpp"
#include "Tracker.hpp"
#include "Types.hpp"
#include <array>
#include <string>
#include <vector>

struct TeamWindowSummary
{
    int         frames = 0;              // frames with at least one player of the team
    double      avg_players = 0.0;
    cv::Point2d centroid;
    double      hull_area = 0.0;         // mean convex-hull area, m^2
    double      depth = 0.0;             // mean x extent, m
    double      breadth = 0.0;           // mean y extent, m
    std::vector<int> zone_counts;        // player-frame observations per pitch zone
    std::string formation;               // outfield lines from defence to attack, "4-4-2"
};

struct TacticalWindow
{
    double start = 0.0, end = 0.0;
    std::array<TeamWindowSummary, 2> teams;
};

struct PossessionStats
{
    std::array<double, 2> controlled_time{};   // seconds
    std::array<double, 2> percentage{};        // of total match time
    double total_time = 0.0;
};

using HeatMap = std::vector<std::vector<double>>;   // rows x cols, max-normalised

struct TacticalSummary
{
    std::vector<TacticalWindow> windows;
    PossessionStats             possession;
    std::array<HeatMap, 2>      heatmaps;
};

/** Pure aggregation over finished snapshots and episodes. */
class TacticalAggregator
{
public:
    TacticalAggregator(const TacticalConfig& cfg, const PitchModel& pitch,
                       bool team0_attacks_right);

    TacticalSummary aggregate(const std::vector<FrameSnapshot>& snapshots,
                              const std::vector<PossessionEpisode>& episodes) const;

    PossessionStats possession(const std::vector<FrameSnapshot>& snapshots,
                               const std::vector<PossessionEpisode>& episodes) const;

    /** Outfield line structure from mean positions, e.g. "4-3-3". */
    std::string formation(const std::vector<cv::Point2d>& outfield, int team) const;

private:
    TacticalWindow summarise(double start, double end,
                             const std::vector<const FrameSnapshot*>& frames) const;
    std::array<HeatMap, 2> heatmaps(const std::vector<FrameSnapshot>& snapshots) const;

    TacticalConfig cfg_;
    PitchModel     pitch_;
    bool           team0_attacks_right_;
};
