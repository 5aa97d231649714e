#pragma once
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

// ─── detections (produced externally, consumed once) ─────────────────────────

enum class DetectionClass
{
    Player,
    Goalkeeper,
    Referee,
    Ball
};

const char* to_string(DetectionClass c);
std::optional<DetectionClass> parse_detection_class(const std::string& s);

constexpr int kUnknownTeam = -1;

struct Detection
{
    DetectionClass cls = DetectionClass::Player;
    double x = 0, y = 0, w = 0, h = 0;   // pixel bbox, w = h = 0 is a point
    double confidence = 1.0;
    int    team = kUnknownTeam;          // 0, 1 or unknown

    /** Ground contact point in pixels: bottom-centre for people, centre for the ball. */
    cv::Point2d anchor() const;
    double area() const { return w * h; }
};

struct FrameBatch
{
    long   frame = 0;
    double ts    = 0.0;                  // seconds
    std::vector<Detection> dets;
    std::string malformed;               // set by a reader that could not decode a detection
};

/** Empty string when the detection is usable, otherwise why it is not. */
std::string validate_detection(const Detection& d);

// ─── tracks ─────────────────────────────────────────────────────────────────

enum class TrackStatus
{
    Active,
    Coasting,
    Lost
};

const char* to_string(TrackStatus s);

struct TrackSample
{
    long        frame = 0;
    double      ts = 0.0;
    cv::Point2d pitch;                   // measured, metres
    cv::Point2d pixel;
    double      confidence = 0.0;
    int         missed = 0;              // tracker steps without a match before this one
};

// ─── events ─────────────────────────────────────────────────────────────────

enum class EventType
{
    Pass,
    Shot,
    Goal,
    PossessionChange
};

enum class PassOutcome { Complete, Intercepted };
enum class PassLength  { Short, Medium, Long };
enum class PassDirection { Forward, Backward, Lateral };
enum class ShotOutcome { Goal, Saved, Blocked, Wide, Recovered, Loose };

const char* to_string(EventType t);
const char* to_string(PassOutcome o);
const char* to_string(PassLength l);
const char* to_string(PassDirection d);
const char* to_string(ShotOutcome o);

struct PassInfo
{
    int           from = -1, to = -1;
    PassOutcome   outcome = PassOutcome::Complete;
    double        length = 0.0;
    PassLength    length_class = PassLength::Short;
    PassDirection direction = PassDirection::Lateral;
};

struct ShotInfo
{
    int         by = -1;
    bool        on_target = false;
    ShotOutcome outcome = ShotOutcome::Loose;
    cv::Point2d origin;
};

struct GoalInfo
{
    int by = -1;
};

struct PossessionChangeInfo
{
    int from_team = kUnknownTeam, to_team = kUnknownTeam;
    int gained_by = -1;
};

/** Immutable once emitted. Exactly one of the payloads matches `type`. */
struct Event
{
    EventType   type = EventType::Pass;
    double      ts = 0.0;                // when the event starts (kick, control)
    double      resolved_ts = 0.0;       // when the evidence became conclusive
    long        frame = 0;
    int         team = kUnknownTeam;
    int         ball_track = -1;
    std::vector<int> evidence_tracks;

    PassInfo             pass;
    ShotInfo             shot;
    GoalInfo             goal;
    PossessionChangeInfo change;
};

// ─── possession ─────────────────────────────────────────────────────────────

enum class EpisodeOutcome
{
    Turnover,
    Shot,
    Goal,
    OutOfPlay,
    LooseBall,
    Unfinished
};

const char* to_string(EpisodeOutcome o);

struct ControlSpell
{
    int    track_id = -1;
    int    team = kUnknownTeam;
    double start = 0.0, end = 0.0;
};

struct PossessionEpisode
{
    int    id = 0;
    int    team = kUnknownTeam;
    int    ball_track = -1;
    double start = 0.0, end = 0.0;
    EpisodeOutcome outcome = EpisodeOutcome::Unfinished;
    std::vector<ControlSpell> spells;
    std::vector<size_t>       events;    // indices into the event sequence
};

// ─── diagnostics ────────────────────────────────────────────────────────────

struct DetectionFrameWarning
{
    long        frame = 0;
    double      ts = 0.0;
    std::string message;
};

/** Not an error: a deliberate non-emission by the event detector. */
struct LowConfidenceOmission
{
    double      ts = 0.0;
    std::string reason;
};
