#pragma once

#include "Providers.hpp"
#include "Preprocessor.hpp"
#include <opencv2/core.hpp>
#include <deque>
#include <optional>
#include <vector>

namespace proctor {

/**
 * @brief Head pose thresholds and deviation dynamics
 */
struct PoseConfig {
    double yaw_threshold = 45.0;         // degrees, |yaw| above this deviates
    double pitch_threshold = 30.0;       // degrees, independent of yaw
    double minor_yaw_threshold = 30.0;   // reported only, never scored
    double minor_pitch_threshold = 25.0;
    double decay_factor = 0.9;           // per non-deviating frame, in (0,1)
    int smoothing_window = 1;            // moving average length, 1 = off
};

/**
 * @brief Angles recovered from one frame's landmarks (degrees)
 *
 * Convention: R = Rz(roll) * Ry(yaw) * Rx(pitch) in OpenCV camera axes
 * (x right, y down, z away from the camera).
 *  - positive yaw turns the nose toward image-left
 *  - positive pitch tips the nose down
 *  - positive roll rotates the face clockwise in the image
 */
struct PoseEstimate {
    double yaw = 0.0;
    double pitch = 0.0;
    double roll = 0.0;
    int landmarks_count = 0;
    float confidence = 0.0f;
    bool face_detected = false;

    static PoseEstimate no_face(int landmarks_count = 0);
};

struct EulerAngles {
    double yaw = 0.0;
    double pitch = 0.0;
    double roll = 0.0;
};

enum class DeviationPhase {
    NORMAL,
    DEVIATING
};

const char* deviation_phase_to_string(DeviationPhase phase);

/**
 * @brief Per-session deviation tracking (owned by the session registry)
 *
 * duration_accumulated grows by dt while deviating and is multiplied by the
 * configured decay_factor on every other processed frame with a face. Frames
 * without a face leave it untouched.
 */
struct DeviationState {
    DeviationPhase phase = DeviationPhase::NORMAL;
    double duration_accumulated = 0.0;
    std::optional<double> last_update_at;
    std::deque<double> yaw_history;
    std::deque<double> pitch_history;
};

struct DeviationReport {
    bool face_detected = false;
    bool deviating = false;
    bool minor_deviation = false;
    double duration_accumulated = 0.0;
    DeviationPhase phase = DeviationPhase::NORMAL;
    double smoothed_yaw = 0.0;
    double smoothed_pitch = 0.0;
};

/**
 * @brief Head pose from six facial landmarks via perspective-n-point
 *
 * estimate() is stateless and safe to call from worker threads. advance()
 * mutates the session's DeviationState and must run on the session thread.
 */
class HeadPoseEstimator {
public:
    explicit HeadPoseEstimator(const PoseConfig& config = PoseConfig());

    /**
     * @brief Recover yaw/pitch/roll from landmarks
     * @param landmarks Provider output (normalized to the ROI image), or nullopt
     * @param roi Geometry used to map landmarks back to full-frame pixels
     */
    PoseEstimate estimate(const std::optional<FaceLandmarks>& landmarks, const RoiInfo& roi) const;

    /**
     * @brief Advance the deviation state machine by one processed frame
     * @param timestamp Capture time of the frame (seconds)
     */
    DeviationReport advance(const PoseEstimate& pose, double timestamp, DeviationState& state) const;
    DeviationReport advance(const PoseEstimate& pose, double timestamp, DeviationState& state,
                            const PoseConfig& config) const;

    const PoseConfig& config() const { return config_; }

    /**
     * @brief Solve PnP for full-frame pixel points in FacialPoint order
     * @return Euler angles, or nullopt if the solver fails
     */
    static std::optional<EulerAngles> solve(const std::vector<cv::Point2f>& image_points,
                                            const cv::Size& frame_size);

    static EulerAngles rotation_to_euler(const cv::Mat& rotation);
    static cv::Mat euler_to_rotation(const EulerAngles& angles);

    static cv::Mat camera_matrix(const cv::Size& frame_size);

    /**
     * @brief Canonical face model in FacialPoint order (millimetres)
     */
    static const std::vector<cv::Point3f>& model_points();
    static const std::vector<FacialPoint>& required_points();

    static bool is_deviating(double yaw, double pitch, const PoseConfig& config);
    static bool is_minor_deviation(double yaw, double pitch, const PoseConfig& config);

private:
    PoseConfig config_;
};

} // namespace proctor
