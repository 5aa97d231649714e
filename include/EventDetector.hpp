#pragma once
#include "Config.hpp"
#include "Types.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

enum class PlayState
{
    Neutral,        // no clear possession
    Controlled,     // one player within control radius, ball slow
    InTransit,      // ball kicked away from the controller
    Terminal        // goal or out of play, waiting for the restart
};

const char* to_string(PlayState s);

struct BallObservation
{
    int         track_id = -1;
    cv::Point2d position;
    cv::Point2d velocity;
    double      speed = 0.0;
};

struct PersonObservation
{
    int            track_id = -1;
    DetectionClass cls = DetectionClass::Player;
    int            team = kUnknownTeam;
    cv::Point2d    position;
};

/** Everything the detector needs from one tracked frame. */
struct FrameObservation
{
    long   frame = 0;
    double ts = 0.0;
    std::optional<BallObservation> ball;     // empty while the ball is unobserved
    std::vector<PersonObservation> people;   // players and goalkeepers only
};

/**
 * Per-analysis state of the possession state machine. One context per
 * stream; nothing in it is shared between analyses.
 */
struct MatchContext
{
    PlayState state = PlayState::Neutral;

    // control
    int         controller = -1;
    int         controller_team = kUnknownTeam;
    cv::Point2d controller_pos;
    int         last_controller = -1;
    int         last_controller_team = kUnknownTeam;

    // kick confirmation and ambiguity tracking while controlled
    int         kick_streak = 0;
    double      kick_ts = 0.0;
    long        kick_frame = 0;
    cv::Point2d kick_origin;
    cv::Point2d kick_dir;
    double      ambiguous_since = -1.0;

    struct Transit
    {
        int         from = -1;
        int         from_team = kUnknownTeam;
        double      start = 0.0;
        long        frame = 0;
        cv::Point2d origin;
        cv::Point2d dir;
        bool        ambiguous = false;
        bool        shot = false;
        bool        on_target = false;
    } transit;

    // episodes
    std::optional<PossessionEpisode> episode;    // currently open
    int    last_episode_team = kUnknownTeam;
    int    next_episode_id = 1;
    int    ball_track = -1;

    // clock
    bool   started = false;
    double first_ts = 0.0;
    double last_ts = 0.0;
    double last_ball_ts = 0.0;
    cv::Point2d last_ball_pos;

    // output
    std::vector<Event>                 events;
    std::vector<PossessionEpisode>     episodes;
    std::vector<LowConfidenceOmission> omissions;
};

class EventDetector
{
public:
    EventDetector(const EventConfig& cfg, const PitchModel& pitch);

    /** Advance the state machine by one frame. Frames must arrive in time order. */
    void step(const FrameObservation& obs, MatchContext& ctx) const;
    /** Close whatever is still open at the end of the stream. */
    void finish(MatchContext& ctx) const;

private:
    const PersonObservation* nearest(const FrameObservation& obs, const cv::Point2d& ball) const;
    const PersonObservation* person(const FrameObservation& obs, int track_id) const;

    void start_control(const PersonObservation& p, const FrameObservation& obs,
                       MatchContext& ctx) const;
    void release_control(MatchContext& ctx) const;
    void begin_transit(bool ambiguous, const BallObservation& b, MatchContext& ctx) const;
    void open_episode(int team, double ts, MatchContext& ctx) const;
    void close_episode(EpisodeOutcome outcome, double ts, MatchContext& ctx) const;
    void to_neutral(EpisodeOutcome outcome, double ts, MatchContext& ctx) const;
    void to_terminal(EpisodeOutcome outcome, double ts, MatchContext& ctx) const;
    void emit(Event e, MatchContext& ctx) const;
    void omit(double ts, const std::string& reason, MatchContext& ctx) const;

    void emit_shot(ShotOutcome outcome, const FrameObservation& obs, MatchContext& ctx,
                   int evidence = -1) const;
    void emit_pass(const PersonObservation& to, const FrameObservation& obs,
                   MatchContext& ctx) const;
    void emit_goal(int scorer, int team, const FrameObservation& obs, MatchContext& ctx) const;

    void step_controlled(const BallObservation& b, const PersonObservation* cand,
                         bool controllable, const FrameObservation& obs, MatchContext& ctx) const;
    void step_transit(const BallObservation& b, const PersonObservation* cand,
                      bool controllable, const FrameObservation& obs, MatchContext& ctx) const;

    PassDirection pass_direction(int team, const cv::Point2d& delta) const;

    EventConfig cfg_;
    PitchModel  pitch_;
};
