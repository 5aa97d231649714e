#include "Config.hpp"
#include "Errors.hpp"
#include <gtest/gtest.h>

TEST(IniFile, ReadsSectionsAndStripsComments)
{
    IniFile ini = IniFile::parse(
        "; top comment\n"
        "[tracker]\n"
        "max-dist = 2.5   ; metres\n"
        "max-coast-frames=20\n"
        "[events]\n"
        "team0-attacks-right = no\n"
        "control-radius = 1.25 # inline\n");

    EXPECT_DOUBLE_EQ(ini.get_double("tracker", "max-dist", 0.0), 2.5);
    EXPECT_EQ(ini.get_int("tracker", "max-coast-frames", 0), 20);
    EXPECT_FALSE(ini.get_bool("events", "team0-attacks-right", true));
    EXPECT_DOUBLE_EQ(ini.get_double("events", "control-radius", 0.0), 1.25);
    EXPECT_DOUBLE_EQ(ini.get_double("events", "kick-speed", 6.0), 6.0);
    EXPECT_FALSE(ini.get("pitch", "length").has_value());
}

TEST(IniFile, BadNumberIsConfigError)
{
    IniFile ini = IniFile::parse("[pitch]\nlength = long\nthirds = 3.5\n");
    EXPECT_THROW(ini.get_double("pitch", "length", 105.0), ConfigError);
    EXPECT_THROW(ini.get_int("pitch", "thirds", 3), ConfigError);
}

TEST(IniFile, MissingFileIsEmpty)
{
    EXPECT_TRUE(IniFile::load("/nonexistent/defaults.ini").empty());
}

TEST(PipelineConfig, FromIniOverridesDefaults)
{
    IniFile ini = IniFile::parse(
        "[tracker]\nmax-dist = 4\n"
        "[kinematics]\nsprint-speed = 7.5\n"
        "[calibration]\nmode = homography\nhomography = 2 0 0, 0 2 0, 0 0 1\n");
    PipelineConfig cfg = PipelineConfig::from_ini(ini);

    EXPECT_DOUBLE_EQ(cfg.tracker.gating_distance, 4.0);
    EXPECT_DOUBLE_EQ(cfg.kinematics.sprint_speed, 7.5);
    EXPECT_EQ(cfg.tracker.max_coast_frames, 15);
    EXPECT_EQ(cfg.calibration.mode, CalibrationMode::Homography);
    EXPECT_DOUBLE_EQ(cfg.calibration.homography(0, 0), 2.0);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(PipelineConfig, RejectsWrongPointCount)
{
    IniFile ini = IniFile::parse(
        "[calibration]\nmode = reference-points\npixel-points = 0 0 1 1\n");
    EXPECT_THROW(PipelineConfig::from_ini(ini), ConfigError);
}

TEST(PipelineConfig, ValidateRejectsNonsense)
{
    PipelineConfig cfg;
    cfg.events.control_radius = 0.0;
    EXPECT_THROW(cfg.validate(), ConfigError);

    cfg = PipelineConfig{};
    cfg.events.control_speed = 8.0;     // above kick speed
    EXPECT_THROW(cfg.validate(), ConfigError);
}

TEST(IniFile, BooleansIgnoreCaseAndRejectNonAscii)
{
    IniFile ini = IniFile::parse("[events]\na = TRUE\nb = Off\nc = \xc3\xa9t\xc3\xa9\n");
    EXPECT_TRUE(ini.get_bool("events", "a", false));
    EXPECT_FALSE(ini.get_bool("events", "b", true));
    EXPECT_THROW(ini.get_bool("events", "c", true), ConfigError);
}

TEST(PipelineConfig, NegativeQueueCapacityRejected)
{
    EXPECT_THROW(PipelineConfig::from_ini(IniFile::parse("[pipeline]\nqueue-capacity = -1\n")),
                 ConfigError);
    EXPECT_THROW(PipelineConfig::from_ini(IniFile::parse("[pipeline]\nqueue-capacity = 0\n")),
                 ConfigError);
    EXPECT_EQ(PipelineConfig::from_ini(IniFile::parse("[pipeline]\nqueue-capacity = 8\n"))
                  .queue_capacity,
              8u);
}

TEST(PipelineConfig, TacticalStrideWithinWindow)
{
    PipelineConfig cfg = PipelineConfig::from_ini(
        IniFile::parse("[tactical]\nwindow = 30\nstride = 10\n"));
    EXPECT_DOUBLE_EQ(cfg.tactical.stride, 10.0);
    EXPECT_NO_THROW(cfg.validate());

    cfg.tactical.stride = 45.0;
    EXPECT_THROW(cfg.validate(), ConfigError);
    cfg.tactical.stride = -1.0;
    EXPECT_THROW(cfg.validate(), ConfigError);
}

TEST(PitchModel, ZonesAndGoals)
{
    PitchModel p;
    EXPECT_EQ(p.zone_count(), 9);
    EXPECT_EQ(p.zone_of({10, 10}), 0);
    EXPECT_EQ(p.zone_of({100, 60}), 8);
    EXPECT_EQ(p.zone_of({-5, 80}), 6);          // clamped
    EXPECT_EQ(p.zone_name(4), "middle_third/centre");

    EXPECT_EQ(p.goal_side({105.5, 34}), 1);
    EXPECT_EQ(p.goal_side({-0.5, 36}), -1);
    EXPECT_EQ(p.goal_side({105.5, 40}), 0);     // wide of the post
    EXPECT_EQ(p.goal_side({50, 34}), 0);
}
