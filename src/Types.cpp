#include "Types.hpp"
#include <cmath>
#include <sstream>

using namespace std;

const char* to_string(DetectionClass c)
{
    switch (c) {
        case DetectionClass::Player:     return "player";
        case DetectionClass::Goalkeeper: return "goalkeeper";
        case DetectionClass::Referee:    return "referee";
        case DetectionClass::Ball:       return "ball";
    }
    return "unknown";
}

optional<DetectionClass> parse_detection_class(const string& s)
{
    if (s == "player")     return DetectionClass::Player;
    if (s == "goalkeeper") return DetectionClass::Goalkeeper;
    if (s == "referee")    return DetectionClass::Referee;
    if (s == "ball")       return DetectionClass::Ball;
    return nullopt;
}

cv::Point2d Detection::anchor() const
{
    if (cls == DetectionClass::Ball)
        return {x + w * 0.5, y + h * 0.5};
    return {x + w * 0.5, y + h};
}

string validate_detection(const Detection& d)
{
    ostringstream msg;
    if (!isfinite(d.x) || !isfinite(d.y) || !isfinite(d.w) || !isfinite(d.h))
        msg << "non-finite bbox";
    else if (d.w < 0.0 || d.h < 0.0)
        msg << "negative bbox size w=" << d.w << ", h=" << d.h;
    else if (!isfinite(d.confidence) || d.confidence < 0.0 || d.confidence > 1.0)
        msg << "confidence " << d.confidence << " outside [0,1]";
    else if (d.team != kUnknownTeam && d.team != 0 && d.team != 1)
        msg << "team label " << d.team << " outside {-1,0,1}";
    return msg.str();
}

const char* to_string(TrackStatus s)
{
    switch (s) {
        case TrackStatus::Active:   return "active";
        case TrackStatus::Coasting: return "coasting";
        case TrackStatus::Lost:     return "lost";
    }
    return "unknown";
}

const char* to_string(EventType t)
{
    switch (t) {
        case EventType::Pass:             return "pass";
        case EventType::Shot:             return "shot";
        case EventType::Goal:             return "goal";
        case EventType::PossessionChange: return "possession_change";
    }
    return "unknown";
}

const char* to_string(PassOutcome o)
{
    switch (o) {
        case PassOutcome::Complete:    return "complete";
        case PassOutcome::Intercepted: return "intercepted";
    }
    return "unknown";
}

const char* to_string(PassLength l)
{
    switch (l) {
        case PassLength::Short:  return "short";
        case PassLength::Medium: return "medium";
        case PassLength::Long:   return "long";
    }
    return "unknown";
}

const char* to_string(PassDirection d)
{
    switch (d) {
        case PassDirection::Forward:  return "forward";
        case PassDirection::Backward: return "backward";
        case PassDirection::Lateral:  return "lateral";
    }
    return "unknown";
}

const char* to_string(ShotOutcome o)
{
    switch (o) {
        case ShotOutcome::Goal:      return "goal";
        case ShotOutcome::Saved:     return "saved";
        case ShotOutcome::Blocked:   return "blocked";
        case ShotOutcome::Wide:      return "wide";
        case ShotOutcome::Recovered: return "recovered";
        case ShotOutcome::Loose:     return "loose";
    }
    return "unknown";
}

const char* to_string(EpisodeOutcome o)
{
    switch (o) {
        case EpisodeOutcome::Turnover:   return "turnover";
        case EpisodeOutcome::Shot:       return "shot";
        case EpisodeOutcome::Goal:       return "goal";
        case EpisodeOutcome::OutOfPlay:  return "out_of_play";
        case EpisodeOutcome::LooseBall:  return "loose_ball";
        case EpisodeOutcome::Unfinished: return "unfinished";
    }
    return "unknown";
}
