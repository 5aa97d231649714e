#pragma once
#include "Kinematics.hpp"
#include "TacticalAggregator.hpp"
#include "Tracker.hpp"
#include "Types.hpp"
#include <array>
#include <map>
#include <string>
#include <vector>

struct TrackReport
{
    int              id = -1;
    DetectionClass   cls = DetectionClass::Player;
    int              team = kUnknownTeam;
    TrackStatus      status = TrackStatus::Active;
    double           first_ts = 0.0, last_ts = 0.0;
    size_t           samples = 0;
    KinematicSummary kinematics;
};

struct TeamTechnical
{
    int    passes = 0;
    int    completed = 0;
    int    intercepted = 0;              // passes by this team won by the opponent
    double pass_accuracy = 0.0;          // percent
    int    short_passes = 0, medium_passes = 0, long_passes = 0;
    int    forward = 0, backward = 0, lateral = 0;
    int    shots = 0;
    int    on_target = 0;
    double shot_accuracy = 0.0;          // percent
    int    goals = 0;
    int    possessions_won = 0;
};

enum class Completion
{
    Complete,
    Aborted,            // caller asked to stop
    SequenceRejected,   // out-of-order or duplicate frame
    SourceFailed        // the detection source could not be read
};

const char* to_string(Completion c);

struct AnalysisResult
{
    Completion  completion = Completion::Complete;
    std::string abort_reason;

    long   frames_processed = 0;
    long   frames_skipped = 0;
    double start_ts = 0.0, end_ts = 0.0;

    std::vector<TrackReport>           tracks;
    std::vector<Event>                 events;
    std::vector<PossessionEpisode>     episodes;
    TacticalSummary                    tactical;
    std::array<TeamTechnical, 2>       technical;
    std::vector<DetectionFrameWarning> warnings;
    std::vector<LowConfidenceOmission> omissions;

    bool complete() const { return completion == Completion::Complete; }
};

/** Merges the analytics stages into one result. */
class ReportAssembler
{
public:
    static std::vector<TrackReport> tracks(const TrackStore& store,
                                           const std::map<int, KinematicProfile>& profiles);
    static std::array<TeamTechnical, 2> technical(const std::vector<Event>& events);
};
