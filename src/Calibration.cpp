#include "Calibration.hpp"
#include "Errors.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>

using namespace std;

// -------- utility functions --------------

// Twice the signed triangle area, scaled by the longest side so the test is unit-free
static double collinearity(const cv::Point2d& a, const cv::Point2d& b, const cv::Point2d& c)
{
    double cross = (b - a).cross(c - a);
    double side = max({cv::norm(b - a), cv::norm(c - a), cv::norm(c - b)});
    if (side <= 0.0) return 0.0;
    return fabs(cross) / (side * side);
}

static void check_points(const array<cv::Point2d, 4>& pts, const char* which)
{
    for (int i = 0; i < 4; ++i)
        for (int j = i + 1; j < 4; ++j)
            for (int k = j + 1; k < 4; ++k)
                if (collinearity(pts[i], pts[j], pts[k]) < 1e-9) {
                    ostringstream msg;
                    msg << "degenerate " << which << " reference points: "
                        << pts[i] << ", " << pts[j] << ", " << pts[k] << " are collinear";
                    throw CalibrationError(msg.str());
                }
}

cv::Point2d Calibration::apply(const cv::Matx33d& M, const cv::Point2d& p)
{
    cv::Vec3d v = M * cv::Vec3d(p.x, p.y, 1.0);
    if (fabs(v[2]) < 1e-12) {
        ostringstream msg;
        msg << "point " << p << " projects to infinity";
        throw CalibrationError(msg.str());
    }
    return {v[0] / v[2], v[1] / v[2]};
}

// -------- Calibration -------------------

Calibration::Calibration(const cv::Matx33d& pixel_to_pitch)
    : H_(pixel_to_pitch)
{
    for (double v : H_.val)
        if (!isfinite(v)) throw CalibrationError("homography has non-finite entries");

    cv::Mat w;
    cv::SVD::compute(cv::Mat(H_), w, cv::SVD::NO_UV);
    double smax = w.at<double>(0), smin = w.at<double>(2);
    if (smax <= 0.0 || smin / smax < 1e-12)
        throw CalibrationError("homography is singular");

    H_inv_ = H_.inv(cv::DECOMP_SVD);
}

Calibration Calibration::from_reference_points(const array<cv::Point2d, 4>& pixel,
                                               const array<cv::Point2d, 4>& pitch)
{
    check_points(pixel, "pixel");
    check_points(pitch, "pitch");

    cv::Point2f src[4], dst[4];
    for (int i = 0; i < 4; ++i) {
        src[i] = cv::Point2f(pixel[i]);
        dst[i] = cv::Point2f(pitch[i]);
    }
    cv::Mat H = cv::getPerspectiveTransform(src, dst);
    return Calibration(cv::Matx33d(H));
}

Calibration Calibration::fixed_pitch(double frame_w, double frame_h, const PitchModel& pitch)
{
    if (frame_w <= 0.0 || frame_h <= 0.0)
        throw CalibrationError("frame size must be positive for the fixed-pitch assumption");
    return Calibration(cv::Matx33d(pitch.length / frame_w, 0, 0,
                                   0, pitch.width / frame_h, 0,
                                   0, 0, 1));
}

Calibration Calibration::from_config(const CalibrationConfig& c, const PitchModel& pitch)
{
    switch (c.mode) {
        case CalibrationMode::Homography:      return Calibration(c.homography);
        case CalibrationMode::ReferencePoints: return from_reference_points(c.pixel_points,
                                                                            c.pitch_points);
        case CalibrationMode::FixedPitch:      break;
    }
    return fixed_pitch(c.frame_width, c.frame_height, pitch);
}

cv::Point2d Calibration::to_pitch(const cv::Point2d& pixel) const
{
    return apply(H_, pixel);
}

cv::Point2d Calibration::to_pixel(const cv::Point2d& pitch) const
{
    return apply(H_inv_, pitch);
}

// -------- CalibrationCache --------------

shared_ptr<const Calibration> CalibrationCache::get(const CalibrationConfig& c,
                                                    const PitchModel& pitch)
{
    lock_guard<mutex> lock(mu_);
    auto it = by_setup_.find(c.setup);
    if (it != by_setup_.end()) return it->second;

    auto cal = make_shared<const Calibration>(Calibration::from_config(c, pitch));
    by_setup_.emplace(c.setup, cal);
    return cal;
}

size_t CalibrationCache::size() const
{
    lock_guard<mutex> lock(mu_);
    return by_setup_.size();
}
