#include "EventDetector.hpp"
#include "Scenario.hpp"
#include <gtest/gtest.h>
#include <cmath>

static PersonObservation person(int id, int team, double x, double y,
                                DetectionClass cls = DetectionClass::Player)
{
    PersonObservation p;
    p.track_id = id;
    p.cls = cls;
    p.team = team;
    p.position = {x, y};
    return p;
}

static MatchContext run(const std::vector<FrameObservation>& frames, bool finish = true,
                        EventConfig cfg = EventConfig{})
{
    EventDetector detector(cfg, PitchModel{});
    MatchContext ctx;
    for (const auto& f : frames) detector.step(f, ctx);
    if (finish) detector.finish(ctx);
    return ctx;
}

static int count(const MatchContext& ctx, EventType type)
{
    int n = 0;
    for (const auto& e : ctx.events) n += e.type == type;
    return n;
}

/** Ball rests at `from`, travels to `to` at `step` metres per frame, then rests. */
static std::vector<cv::Point2d> kick(cv::Point2d from, cv::Point2d to, double step,
                                     int rest_before = 5, int rest_after = 10)
{
    std::vector<cv::Point2d> path(rest_before, from);
    cv::Point2d d = to - from;
    int n = int(std::ceil(cv::norm(d) / step));
    for (int i = 1; i <= n; ++i) path.push_back(from + d * (double(i) / n));
    for (int i = 0; i < rest_after; ++i) path.push_back(to);
    return path;
}

TEST(EventDetector, StraightPassBetweenTeammates)
{
    std::vector<PersonObservation> people = {person(1, 0, 40, 34), person(2, 0, 50, 34)};
    MatchContext ctx = run(ball_path(kick({40, 34}, {50, 34}, 0.4), people));

    ASSERT_EQ(ctx.events.size(), 1u);
    const Event& e = ctx.events[0];
    EXPECT_EQ(e.type, EventType::Pass);
    EXPECT_EQ(e.pass.from, 1);
    EXPECT_EQ(e.pass.to, 2);
    EXPECT_EQ(e.pass.outcome, PassOutcome::Complete);
    EXPECT_EQ(e.pass.direction, PassDirection::Forward);
    EXPECT_EQ(e.pass.length_class, PassLength::Short);
    EXPECT_NEAR(e.pass.length, 10.0, 1e-9);
    EXPECT_LT(e.ts, e.resolved_ts);
    EXPECT_EQ(e.team, 0);
    EXPECT_EQ(e.ball_track, 99);

    // One episode for the whole move, still open at the end of the stream
    ASSERT_EQ(ctx.episodes.size(), 1u);
    EXPECT_EQ(ctx.episodes[0].outcome, EpisodeOutcome::Unfinished);
    EXPECT_EQ(ctx.episodes[0].spells.size(), 2u);
    EXPECT_EQ(ctx.episodes[0].events.size(), 1u);
}

TEST(EventDetector, PassToOpponentIsIntercepted)
{
    std::vector<PersonObservation> people = {person(1, 0, 40, 34), person(7, 1, 50, 34)};
    MatchContext ctx = run(ball_path(kick({40, 34}, {50, 34}, 0.4), people));

    ASSERT_EQ(count(ctx, EventType::Pass), 1);
    EXPECT_EQ(ctx.events[0].pass.outcome, PassOutcome::Intercepted);
    ASSERT_EQ(count(ctx, EventType::PossessionChange), 1);
    EXPECT_EQ(ctx.events[1].change.from_team, 0);
    EXPECT_EQ(ctx.events[1].change.to_team, 1);
    EXPECT_EQ(ctx.events[1].change.gained_by, 7);

    ASSERT_EQ(ctx.episodes.size(), 2u);
    EXPECT_EQ(ctx.episodes[0].outcome, EpisodeOutcome::Turnover);
    EXPECT_LE(ctx.episodes[0].end, ctx.episodes[1].start);
}

TEST(EventDetector, DribbledGoalIsCreditedToController)
{
    // C carries the ball into the goal at 2 m/s
    std::vector<FrameObservation> frames;
    for (int i = 0; i < 80; ++i) {
        FrameObservation o;
        o.frame = i;
        o.ts = i * kFrameDt;
        BallObservation b;
        b.track_id = 99;
        b.position = {100.0 + 0.08 * i, 34.0};
        if (i > 0) {
            b.velocity = {2.0, 0.0};
            b.speed = 2.0;
        }
        o.ball = b;
        o.people = {person(3, 1, b.position.x - 0.5, 34.0)};
        frames.push_back(o);
    }
    MatchContext ctx = run(frames, false);

    ASSERT_EQ(ctx.events.size(), 1u);
    EXPECT_EQ(ctx.events[0].type, EventType::Goal);
    EXPECT_EQ(ctx.events[0].goal.by, 3);
    EXPECT_EQ(ctx.events[0].team, 1);
    EXPECT_EQ(ctx.state, PlayState::Terminal);
    ASSERT_EQ(ctx.episodes.size(), 1u);
    EXPECT_EQ(ctx.episodes[0].outcome, EpisodeOutcome::Goal);
}

TEST(EventDetector, ShotIntoGoal)
{
    std::vector<PersonObservation> people = {person(3, 1, 100, 34)};
    MatchContext ctx = run(ball_path(kick({100, 34}, {106, 34}, 0.4, 5, 0), people), false);

    EXPECT_EQ(count(ctx, EventType::Goal), 1);
    ASSERT_EQ(count(ctx, EventType::Shot), 1);
    const Event& shot = ctx.events[0];
    EXPECT_EQ(shot.shot.by, 3);
    EXPECT_TRUE(shot.shot.on_target);
    EXPECT_EQ(shot.shot.outcome, ShotOutcome::Goal);
    EXPECT_EQ(ctx.events[1].goal.by, 3);
    EXPECT_EQ(ctx.state, PlayState::Terminal);
}

TEST(EventDetector, ShotSavedByKeeper)
{
    std::vector<PersonObservation> people = {person(3, 1, 90, 34), person(20, 0, 103, 34, DetectionClass::Goalkeeper)};
    std::vector<cv::Point2d> path = kick({90, 34}, {103, 34}, 0.5);
    MatchContext ctx = run(ball_path(path, people));

    ASSERT_EQ(count(ctx, EventType::Shot), 1);
    EXPECT_EQ(ctx.events[0].shot.outcome, ShotOutcome::Saved);
    EXPECT_TRUE(ctx.events[0].shot.on_target);
    EXPECT_EQ(count(ctx, EventType::Pass), 0);
    EXPECT_EQ(count(ctx, EventType::Goal), 0);
    EXPECT_EQ(ctx.episodes.front().outcome, EpisodeOutcome::Shot);
}

TEST(EventDetector, WideShotGoesOutOfPlay)
{
    std::vector<PersonObservation> people = {person(3, 1, 90, 30)};
    MatchContext ctx = run(ball_path(kick({90, 30}, {107, 24}, 0.5, 5, 0), people), false);

    ASSERT_EQ(count(ctx, EventType::Shot), 1);
    EXPECT_FALSE(ctx.events[0].shot.on_target);
    EXPECT_EQ(ctx.events[0].shot.outcome, ShotOutcome::Wide);
    EXPECT_EQ(ctx.state, PlayState::Terminal);
    EXPECT_EQ(ctx.episodes.back().outcome, EpisodeOutcome::Shot);
}

TEST(EventDetector, OscillationAroundKickSpeedEmitsNothing)
{
    std::vector<cv::Point2d> path(3, cv::Point2d(50, 34));
    double x = 50.0;
    for (int i = 0; i < 100; ++i) {
        x += i % 2 == 0 ? 0.25 : -0.23;      // 6.25 and 5.75 m/s around a 6 m/s threshold
        path.emplace_back(x, 34);
    }
    std::vector<PersonObservation> people = {person(1, 0, 50, 34)};
    MatchContext ctx = run(ball_path(path, people));

    EXPECT_TRUE(ctx.events.empty());
    EXPECT_FALSE(ctx.omissions.empty());
}

TEST(EventDetector, KickToNobodyTimesOutToNeutral)
{
    std::vector<PersonObservation> people = {person(1, 0, 40, 34)};
    std::vector<cv::Point2d> path = kick({40, 34}, {70, 34}, 0.4, 5, 80);
    MatchContext ctx = run(ball_path(path, people), false);

    EXPECT_TRUE(ctx.events.empty());
    EXPECT_EQ(ctx.state, PlayState::Neutral);
    ASSERT_EQ(ctx.episodes.size(), 1u);
    EXPECT_EQ(ctx.episodes[0].outcome, EpisodeOutcome::LooseBall);
    EXPECT_FALSE(ctx.omissions.empty());
}

TEST(EventDetector, UnlabelledReceiverIsOmitted)
{
    std::vector<PersonObservation> people = {person(1, 0, 40, 34), person(2, kUnknownTeam, 50, 34)};
    MatchContext ctx = run(ball_path(kick({40, 34}, {50, 34}, 0.4), people));

    EXPECT_EQ(count(ctx, EventType::Pass), 0);
    EXPECT_FALSE(ctx.omissions.empty());
}

TEST(EventDetector, ContextsAreIndependent)
{
    std::vector<PersonObservation> people = {person(1, 0, 40, 34), person(2, 0, 50, 34)};
    auto frames = ball_path(kick({40, 34}, {50, 34}, 0.4), people);

    EventDetector detector(EventConfig{}, PitchModel{});
    MatchContext a, b;
    for (size_t i = 0; i < frames.size(); ++i) {
        detector.step(frames[i], a);
        if (i < 8) detector.step(frames[i], b);
    }
    detector.finish(a);
    detector.finish(b);

    EXPECT_EQ(a.events.size(), 1u);
    EXPECT_TRUE(b.events.empty());
}

/** Kick to nobody, then the loose ball rolls on its own into the right-hand goal. */
static std::vector<FrameObservation> loose_ball_into_goal(bool controller_stays)
{
    std::vector<cv::Point2d> path = kick({40, 34}, {70, 34}, 0.4, 5, 80);
    for (int i = 1; path.back().x < 105.5; ++i) path.emplace_back(70.0 + 0.1 * i, 34.0);

    std::vector<FrameObservation> frames = ball_path(path, {person(1, 0, 40, 34)});
    if (!controller_stays)
        for (size_t i = 10; i < frames.size(); ++i) frames[i].people.clear();
    return frames;
}

TEST(EventDetector, GoalAfterScorerTrackIsLostIsOmitted)
{
    MatchContext ctx = run(loose_ball_into_goal(false), false);

    EXPECT_EQ(count(ctx, EventType::Goal), 0);
    EXPECT_EQ(ctx.state, PlayState::Terminal);
    ASSERT_FALSE(ctx.omissions.empty());
    EXPECT_NE(ctx.omissions.back().reason.find("lost"), std::string::npos);
}

TEST(EventDetector, LooseBallGoalCreditsLastControllerStillOnPitch)
{
    MatchContext ctx = run(loose_ball_into_goal(true), false);

    ASSERT_EQ(count(ctx, EventType::Goal), 1);
    EXPECT_EQ(ctx.events.back().goal.by, 1);
    EXPECT_EQ(ctx.events.back().team, 0);
}
