#include "Calibration.hpp"
#include "Errors.hpp"
#include <gtest/gtest.h>

static const std::array<cv::Point2d, 4> kPixel = {{{312, 820}, {1610, 835}, {1380, 240}, {520, 232}}};
static const std::array<cv::Point2d, 4> kPitch = {{{0, 68}, {105, 68}, {105, 0}, {0, 0}}};

TEST(Calibration, ReferencePointsMapOntoPitch)
{
    Calibration cal = Calibration::from_reference_points(kPixel, kPitch);
    for (int i = 0; i < 4; ++i) {
        cv::Point2d p = cal.to_pitch(kPixel[i]);
        EXPECT_NEAR(p.x, kPitch[i].x, 1e-6);
        EXPECT_NEAR(p.y, kPitch[i].y, 1e-6);
    }
}

TEST(Calibration, RoundTrip)
{
    Calibration cal = Calibration::from_reference_points(kPixel, kPitch);
    for (cv::Point2d px : {cv::Point2d(960, 540), cv::Point2d(400, 300), cv::Point2d(1500, 800)}) {
        cv::Point2d back = cal.to_pixel(cal.to_pitch(px));
        EXPECT_NEAR(back.x, px.x, 1e-6);
        EXPECT_NEAR(back.y, px.y, 1e-6);
    }
}

TEST(Calibration, SingularMatrixRejected)
{
    cv::Matx33d rank2(1, 2, 3,
                      2, 4, 6,
                      0, 0, 1);
    EXPECT_THROW(Calibration{rank2}, CalibrationError);
    EXPECT_THROW(Calibration{cv::Matx33d::zeros()}, CalibrationError);
}

TEST(Calibration, CollinearPointsRejected)
{
    std::array<cv::Point2d, 4> line = {{{0, 0}, {10, 10}, {20, 20}, {5, 40}}};
    EXPECT_THROW(Calibration::from_reference_points(line, kPitch), CalibrationError);
    EXPECT_THROW(Calibration::from_reference_points(kPixel, line), CalibrationError);
}

TEST(Calibration, FixedPitchStretchesFrame)
{
    PitchModel pitch;
    Calibration cal = Calibration::fixed_pitch(1920, 1080, pitch);
    cv::Point2d far = cal.to_pitch({1920, 1080});
    EXPECT_NEAR(far.x, 105.0, 1e-9);
    EXPECT_NEAR(far.y, 68.0, 1e-9);
    EXPECT_THROW(Calibration::fixed_pitch(0, 1080, pitch), CalibrationError);
}

TEST(CalibrationCache, OneCalibrationPerSetup)
{
    CalibrationCache cache;
    PitchModel pitch;
    CalibrationConfig a;
    a.setup = "cam-a";
    CalibrationConfig b = a;
    b.setup = "cam-b";
    b.frame_width = 1280;
    b.frame_height = 720;

    auto first = cache.get(a, pitch);
    auto again = cache.get(a, pitch);
    auto other = cache.get(b, pitch);
    EXPECT_EQ(first.get(), again.get());
    EXPECT_NE(first.get(), other.get());
    EXPECT_EQ(cache.size(), 2u);
}

TEST(Calibration, AxisAlignedReferencePointsGiveLinearScaling)
{
    std::array<cv::Point2d, 4> px = {{{0, 0}, {1050, 0}, {1050, 680}, {0, 680}}};
    std::array<cv::Point2d, 4> pitch = {{{0, 0}, {105, 0}, {105, 68}, {0, 68}}};
    Calibration cal = Calibration::from_reference_points(px, pitch);

    cv::Point2d centre = cal.to_pitch({525, 340});
    EXPECT_NEAR(centre.x, 52.5, 1e-6);
    EXPECT_NEAR(centre.y, 34.0, 1e-6);
}
