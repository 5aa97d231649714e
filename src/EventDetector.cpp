#include "EventDetector.hpp"
#include <cmath>
#include <limits>

using namespace std;

const char* to_string(PlayState s)
{
    switch (s) {
        case PlayState::Neutral:    return "neutral";
        case PlayState::Controlled: return "controlled";
        case PlayState::InTransit:  return "in_transit";
        case PlayState::Terminal:   return "terminal";
    }
    return "unknown";
}

static bool known(int team) { return team != kUnknownTeam; }

// -------- lookups --------------

EventDetector::EventDetector(const EventConfig& cfg, const PitchModel& pitch)
    : cfg_(cfg), pitch_(pitch) {}

const PersonObservation* EventDetector::nearest(const FrameObservation& obs,
                                                const cv::Point2d& ball) const
{
    const PersonObservation* best = nullptr;
    double best_d = numeric_limits<double>::infinity();
    for (const auto& p : obs.people) {
        if (p.cls != DetectionClass::Player && p.cls != DetectionClass::Goalkeeper) continue;
        double d = cv::norm(p.position - ball);
        if (d <= cfg_.control_radius && d < best_d) {
            best = &p;
            best_d = d;
        }
    }
    return best;
}

const PersonObservation* EventDetector::person(const FrameObservation& obs, int track_id) const
{
    for (const auto& p : obs.people)
        if (p.track_id == track_id) return &p;
    return nullptr;
}

PassDirection EventDetector::pass_direction(int team, const cv::Point2d& delta) const
{
    double sign = ((team == 0) == cfg_.team0_attacks_right) ? 1.0 : -1.0;
    double progress = delta.x * sign;
    double lateral = fabs(delta.y);
    if (progress > lateral)  return PassDirection::Forward;
    if (-progress > lateral) return PassDirection::Backward;
    return PassDirection::Lateral;
}

// -------- episodes and emission --------------

void EventDetector::emit(Event e, MatchContext& ctx) const
{
    e.ball_track = ctx.ball_track;
    ctx.events.push_back(std::move(e));
    if (ctx.episode) ctx.episode->events.push_back(ctx.events.size() - 1);
}

void EventDetector::omit(double ts, const string& reason, MatchContext& ctx) const
{
    ctx.omissions.push_back({ts, reason});
}

void EventDetector::open_episode(int team, double ts, MatchContext& ctx) const
{
    PossessionEpisode ep;
    ep.id = ctx.next_episode_id++;
    ep.team = team;
    ep.ball_track = ctx.ball_track;
    ep.start = ts;
    ep.end = ts;
    ctx.episode = ep;
}

void EventDetector::close_episode(EpisodeOutcome outcome, double ts, MatchContext& ctx) const
{
    if (!ctx.episode) return;
    ctx.episode->end = ts;
    ctx.episode->outcome = outcome;
    if (known(ctx.episode->team)) ctx.last_episode_team = ctx.episode->team;
    ctx.episodes.push_back(std::move(*ctx.episode));
    ctx.episode.reset();
}

void EventDetector::release_control(MatchContext& ctx) const
{
    ctx.controller = -1;
    ctx.controller_team = kUnknownTeam;
    ctx.kick_streak = 0;
    ctx.ambiguous_since = -1.0;
}

void EventDetector::to_neutral(EpisodeOutcome outcome, double ts, MatchContext& ctx) const
{
    release_control(ctx);
    close_episode(outcome, ts, ctx);
    ctx.state = PlayState::Neutral;
}

void EventDetector::to_terminal(EpisodeOutcome outcome, double ts, MatchContext& ctx) const
{
    release_control(ctx);
    close_episode(outcome, ts, ctx);
    ctx.state = PlayState::Terminal;
}

void EventDetector::start_control(const PersonObservation& p, const FrameObservation& obs,
                                  MatchContext& ctx) const
{
    if (ctx.episode && known(ctx.episode->team) && known(p.team) && p.team != ctx.episode->team)
        close_episode(EpisodeOutcome::Turnover, obs.ts, ctx);

    if (!ctx.episode) {
        open_episode(p.team, obs.ts, ctx);
        if (known(ctx.last_episode_team) && known(p.team) && p.team != ctx.last_episode_team) {
            Event e;
            e.type = EventType::PossessionChange;
            e.ts = e.resolved_ts = obs.ts;
            e.frame = obs.frame;
            e.team = p.team;
            e.change = {ctx.last_episode_team, p.team, p.track_id};
            e.evidence_tracks = {p.track_id};
            emit(std::move(e), ctx);
        }
    } else if (!known(ctx.episode->team)) {
        ctx.episode->team = p.team;
    }

    release_control(ctx);
    ctx.state = PlayState::Controlled;
    ctx.controller = p.track_id;
    ctx.controller_team = p.team;
    ctx.controller_pos = p.position;
    ctx.last_controller = p.track_id;
    ctx.last_controller_team = p.team;
    ctx.episode->spells.push_back({p.track_id, p.team, obs.ts, obs.ts});
}

void EventDetector::begin_transit(bool ambiguous, const BallObservation& b, MatchContext& ctx) const
{
    MatchContext::Transit t;
    t.from = ctx.controller;
    t.from_team = ctx.controller_team;
    t.ambiguous = ambiguous;
    if (ambiguous) {
        t.start = ctx.ambiguous_since;
        t.frame = 0;
        t.origin = b.position;
    } else {
        t.start = ctx.kick_ts;
        t.frame = ctx.kick_frame;
        t.origin = ctx.kick_origin;
        t.dir = ctx.kick_dir;

        // Shot when the kick heads for a goal region close enough to score from
        for (int side : {-1, 1}) {
            double line_x = side < 0 ? 0.0 : pitch_.length;
            if (t.dir.x * side <= 1e-9) continue;
            if (fabs(line_x - t.origin.x) > cfg_.max_shot_distance) continue;
            double y = t.origin.y + (line_x - t.origin.x) / t.dir.x * t.dir.y;
            double off = fabs(y - pitch_.width * 0.5);
            if (off <= pitch_.goal_region_width * 0.5) {
                t.shot = true;
                t.on_target = off <= pitch_.goal_width * 0.5;
            }
        }
    }

    release_control(ctx);
    ctx.transit = t;
    ctx.state = PlayState::InTransit;
}

void EventDetector::emit_shot(ShotOutcome outcome, const FrameObservation& obs,
                              MatchContext& ctx, int evidence) const
{
    const auto& t = ctx.transit;
    Event e;
    e.type = EventType::Shot;
    e.ts = t.start;
    e.resolved_ts = obs.ts;
    e.frame = t.frame;
    e.team = t.from_team;
    e.shot.by = t.from;
    e.shot.on_target = t.on_target || outcome == ShotOutcome::Goal;
    e.shot.outcome = outcome;
    e.shot.origin = t.origin;
    e.evidence_tracks = {t.from};
    if (evidence >= 0 && evidence != t.from) e.evidence_tracks.push_back(evidence);
    emit(std::move(e), ctx);
}

void EventDetector::emit_pass(const PersonObservation& to, const FrameObservation& obs,
                              MatchContext& ctx) const
{
    const auto& t = ctx.transit;
    cv::Point2d delta = obs.ball ? obs.ball->position - t.origin : to.position - t.origin;

    Event e;
    e.type = EventType::Pass;
    e.ts = t.start;
    e.resolved_ts = obs.ts;
    e.frame = t.frame;
    e.team = t.from_team;
    e.pass.from = t.from;
    e.pass.to = to.track_id;
    e.pass.outcome = to.team == t.from_team ? PassOutcome::Complete : PassOutcome::Intercepted;
    e.pass.length = cv::norm(delta);
    e.pass.length_class = e.pass.length < 15.0 ? PassLength::Short
                        : e.pass.length < 30.0 ? PassLength::Medium
                        : PassLength::Long;
    e.pass.direction = pass_direction(t.from_team, delta);
    e.evidence_tracks = {t.from, to.track_id};
    emit(std::move(e), ctx);
}

void EventDetector::emit_goal(int scorer, int team, const FrameObservation& obs,
                              MatchContext& ctx) const
{
    Event e;
    e.type = EventType::Goal;
    e.ts = e.resolved_ts = obs.ts;
    e.frame = obs.frame;
    e.team = team;
    e.goal.by = scorer;
    e.evidence_tracks = {scorer};
    emit(std::move(e), ctx);
}

// -------- state machine --------------

void EventDetector::step_controlled(const BallObservation& b, const PersonObservation* cand,
                                    bool controllable, const FrameObservation& obs,
                                    MatchContext& ctx) const
{
    const PersonObservation* me = person(obs, ctx.controller);
    if (!me) {
        // Controller's track is gone; possession can no longer be attributed
        to_neutral(EpisodeOutcome::LooseBall, obs.ts, ctx);
        if (controllable) start_control(*cand, obs, ctx);
        return;
    }
    ctx.controller_pos = me->position;

    if (controllable && cand->track_id != ctx.controller) {
        bool turnover = known(cand->team) && known(ctx.controller_team) &&
                        cand->team != ctx.controller_team;
        if (!turnover)
            omit(obs.ts, "control moved between players without a confirmed kick", ctx);
        start_control(*cand, obs, ctx);
        return;
    }

    cv::Point2d away = b.position - me->position;
    double away_n = cv::norm(away);
    double cos_away = 1.0;
    if (b.speed > 0.0 && away_n > 1e-6) cos_away = b.velocity.dot(away) / (b.speed * away_n);

    if (b.speed >= cfg_.kick_speed && cos_away >= cfg_.kick_direction_cos) {
        cv::Point2d dir = b.velocity * (1.0 / b.speed);
        if (ctx.kick_streak > 0 && dir.dot(ctx.kick_dir) < cfg_.direction_consistency_cos)
            ctx.kick_streak = 0;
        if (ctx.kick_streak == 0) {
            ctx.kick_ts = ctx.last_ball_ts;
            ctx.kick_frame = obs.frame;
            ctx.kick_origin = ctx.last_ball_pos;
        }
        ctx.kick_streak++;
        ctx.kick_dir = dir;
        if (ctx.kick_streak >= cfg_.kick_confirm_frames) {
            begin_transit(false, b, ctx);
            return;
        }
    } else {
        ctx.kick_streak = 0;
    }

    bool settled = b.speed <= cfg_.control_speed && away_n <= cfg_.control_radius;
    if (settled) {
        ctx.ambiguous_since = -1.0;
    } else if (ctx.ambiguous_since < 0.0) {
        ctx.ambiguous_since = obs.ts;
    } else if (obs.ts - ctx.ambiguous_since > cfg_.ambiguity_span) {
        omit(obs.ts, "ball neither controlled nor clearly kicked", ctx);
        begin_transit(true, b, ctx);
        return;
    }

    if (ctx.episode && !ctx.episode->spells.empty())
        ctx.episode->spells.back().end = obs.ts;
}

void EventDetector::step_transit(const BallObservation&, const PersonObservation* cand,
                                 bool controllable, const FrameObservation& obs,
                                 MatchContext& ctx) const
{
    const auto& t = ctx.transit;

    if (controllable) {
        const PersonObservation& r = *cand;
        bool opponent = known(r.team) && known(t.from_team) && r.team != t.from_team;

        if (t.ambiguous) {
            start_control(r, obs, ctx);
        } else if (t.shot) {
            ShotOutcome o = ShotOutcome::Recovered;
            if (opponent)
                o = r.cls == DetectionClass::Goalkeeper ? ShotOutcome::Saved : ShotOutcome::Blocked;
            emit_shot(o, obs, ctx, r.track_id);
            if (opponent) close_episode(EpisodeOutcome::Shot, obs.ts, ctx);
            start_control(r, obs, ctx);
        } else if (r.track_id == t.from) {
            start_control(r, obs, ctx);
        } else {
            if (known(r.team) && known(t.from_team)) {
                emit_pass(r, obs, ctx);
                if (opponent) close_episode(EpisodeOutcome::Turnover, obs.ts, ctx);
            } else {
                omit(obs.ts, "pass between players without team labels", ctx);
            }
            start_control(r, obs, ctx);
        }
        return;
    }

    if (obs.ts - t.start > cfg_.transit_timeout) {
        EpisodeOutcome outcome = EpisodeOutcome::LooseBall;
        if (!t.ambiguous) {
            if (t.shot) {
                emit_shot(ShotOutcome::Loose, obs, ctx);
                outcome = EpisodeOutcome::Shot;
            } else {
                omit(obs.ts, "kicked ball reached no player", ctx);
            }
        }
        to_neutral(outcome, obs.ts, ctx);
    }
}

void EventDetector::step(const FrameObservation& obs, MatchContext& ctx) const
{
    if (!ctx.started) {
        ctx.started = true;
        ctx.first_ts = obs.ts;
        ctx.last_ball_ts = obs.ts;
    }

    if (!obs.ball) {
        bool holding = ctx.state == PlayState::Controlled || ctx.state == PlayState::InTransit;
        if (holding && obs.ts - ctx.last_ball_ts > cfg_.transit_timeout) {
            if (ctx.state == PlayState::InTransit && !ctx.transit.ambiguous)
                omit(obs.ts, "ball lost from view during transit", ctx);
            to_neutral(EpisodeOutcome::LooseBall, ctx.last_ball_ts, ctx);
        }
        ctx.last_ts = obs.ts;
        return;
    }

    const BallObservation& b = *obs.ball;
    ctx.ball_track = b.track_id;

    if (ctx.state == PlayState::Terminal) {
        if (pitch_.inside(b.position)) ctx.state = PlayState::Neutral;
    } else if (pitch_.goal_side(b.position) != 0) {
        int scorer = ctx.last_controller, team = ctx.last_controller_team;
        if (ctx.state == PlayState::Controlled) {
            scorer = ctx.controller;
            team = ctx.controller_team;
        } else if (ctx.state == PlayState::InTransit) {
            scorer = ctx.transit.from;
            team = ctx.transit.from_team;
            if (!ctx.transit.ambiguous) emit_shot(ShotOutcome::Goal, obs, ctx);
        }
        // the scorer's track must still be live in this frame
        if (scorer >= 0 && person(obs, scorer))
            emit_goal(scorer, team, obs, ctx);
        else if (scorer >= 0)
            omit(obs.ts, "ball in goal after the scorer's track was lost", ctx);
        else
            omit(obs.ts, "ball in goal without an attributable player", ctx);
        to_terminal(EpisodeOutcome::Goal, obs.ts, ctx);
    } else if (!pitch_.inside(b.position, cfg_.out_margin)) {
        EpisodeOutcome outcome = EpisodeOutcome::OutOfPlay;
        if (ctx.state == PlayState::InTransit && !ctx.transit.ambiguous && ctx.transit.shot) {
            emit_shot(ShotOutcome::Wide, obs, ctx);
            outcome = EpisodeOutcome::Shot;
        }
        to_terminal(outcome, obs.ts, ctx);
    } else {
        const PersonObservation* cand = nearest(obs, b.position);
        bool controllable = cand && b.speed <= cfg_.control_speed;

        switch (ctx.state) {
            case PlayState::Neutral:
                if (controllable) start_control(*cand, obs, ctx);
                break;
            case PlayState::Controlled:
                step_controlled(b, cand, controllable, obs, ctx);
                break;
            case PlayState::InTransit:
                step_transit(b, cand, controllable, obs, ctx);
                break;
            case PlayState::Terminal:
                break;
        }
    }

    ctx.last_ball_ts = obs.ts;
    ctx.last_ball_pos = b.position;
    ctx.last_ts = obs.ts;
}

void EventDetector::finish(MatchContext& ctx) const
{
    if (ctx.state == PlayState::InTransit && !ctx.transit.ambiguous)
        omit(ctx.last_ts, "stream ended before the kicked ball was resolved", ctx);
    close_episode(EpisodeOutcome::Unfinished, ctx.last_ts, ctx);
}
