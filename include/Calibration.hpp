#pragma once
#include "Config.hpp"
#include <opencv2/core.hpp>
#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <string>

/**
 * Pixel <-> pitch projection through a plane homography.
 * Immutable after construction; construction throws CalibrationError.
 */
class Calibration
{
public:
    explicit Calibration(const cv::Matx33d& pixel_to_pitch);

    static Calibration from_reference_points(const std::array<cv::Point2d, 4>& pixel,
                                             const std::array<cv::Point2d, 4>& pitch);
    /** Frame stretched linearly onto the pitch: (0,0)->(0,0), (W,H)->(L,W). */
    static Calibration fixed_pitch(double frame_w, double frame_h, const PitchModel& pitch);
    static Calibration from_config(const CalibrationConfig& c, const PitchModel& pitch);

    cv::Point2d to_pitch(const cv::Point2d& pixel) const;
    cv::Point2d to_pixel(const cv::Point2d& pitch) const;

    const cv::Matx33d& matrix() const { return H_; }
    const cv::Matx33d& inverse() const { return H_inv_; }

private:
    static cv::Point2d apply(const cv::Matx33d& M, const cv::Point2d& p);

    cv::Matx33d H_, H_inv_;
};

/** One calibration per camera setup, computed on first use. */
class CalibrationCache
{
public:
    std::shared_ptr<const Calibration> get(const CalibrationConfig& c, const PitchModel& pitch);
    size_t size() const;

private:
    mutable std::mutex mu_;
    std::map<std::string, std::shared_ptr<const Calibration>> by_setup_;
};
