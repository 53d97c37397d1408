#include "HeadPoseEstimator.hpp"

#include <opencv2/calib3d.hpp> // For solvePnP and Rodrigues
#include <algorithm>
#include <cmath>
#include <numeric>

namespace proctor {

namespace {

constexpr double kRadToDeg = 180.0 / CV_PI;
constexpr double kDegToRad = CV_PI / 180.0;

double mean_of(const std::deque<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

} // namespace

PoseEstimate PoseEstimate::no_face(int landmarks_count) {
    PoseEstimate pose;
    pose.landmarks_count = landmarks_count;
    return pose;
}

const char* deviation_phase_to_string(DeviationPhase phase) {
    return phase == DeviationPhase::DEVIATING ? "deviating" : "normal";
}

// Generic head model, camera axes: x right, y down, z away from the camera.
// The nose tip is the origin and sits closest to the camera.
const std::vector<cv::Point3f>& HeadPoseEstimator::model_points() {
    static const std::vector<cv::Point3f> points = {
        {0.0f,   0.0f,  0.0f},    // Nose tip
        {0.0f,   63.6f, 12.5f},   // Chin
        {-43.3f, -32.7f, 26.0f},  // Left eye outer corner (image left)
        {43.3f,  -32.7f, 26.0f},  // Right eye outer corner
        {-28.9f, 28.9f, 24.1f},   // Left mouth corner
        {28.9f,  28.9f, 24.1f}    // Right mouth corner
    };
    return points;
}

const std::vector<FacialPoint>& HeadPoseEstimator::required_points() {
    static const std::vector<FacialPoint> points = {
        FacialPoint::NOSE_TIP,
        FacialPoint::CHIN,
        FacialPoint::LEFT_EYE_CORNER,
        FacialPoint::RIGHT_EYE_CORNER,
        FacialPoint::LEFT_MOUTH_CORNER,
        FacialPoint::RIGHT_MOUTH_CORNER
    };
    return points;
}

HeadPoseEstimator::HeadPoseEstimator(const PoseConfig& config)
    : config_(config) {
}

cv::Mat HeadPoseEstimator::camera_matrix(const cv::Size& frame_size) {
    double focal_length = frame_size.width;
    cv::Point2d center(frame_size.width / 2.0, frame_size.height / 2.0);

    return (cv::Mat_<double>(3, 3) << focal_length, 0, center.x,
                                      0, focal_length, center.y,
                                      0, 0, 1);
}

EulerAngles HeadPoseEstimator::rotation_to_euler(const cv::Mat& R) {
    double sy = std::sqrt(R.at<double>(0, 0) * R.at<double>(0, 0) +
                          R.at<double>(1, 0) * R.at<double>(1, 0));
    bool singular = sy < 1e-6;

    EulerAngles angles;
    if (!singular) {
        angles.pitch = std::atan2(R.at<double>(2, 1), R.at<double>(2, 2));
        angles.yaw = std::atan2(-R.at<double>(2, 0), sy);
        angles.roll = std::atan2(R.at<double>(1, 0), R.at<double>(0, 0));
    } else {
        // Gimbal lock at yaw = +-90: fold roll into pitch
        angles.pitch = std::atan2(-R.at<double>(1, 2), R.at<double>(1, 1));
        angles.yaw = std::atan2(-R.at<double>(2, 0), sy);
        angles.roll = 0.0;
    }

    angles.pitch *= kRadToDeg;
    angles.yaw *= kRadToDeg;
    angles.roll *= kRadToDeg;
    return angles;
}

cv::Mat HeadPoseEstimator::euler_to_rotation(const EulerAngles& angles) {
    double a = angles.pitch * kDegToRad;
    double b = angles.yaw * kDegToRad;
    double g = angles.roll * kDegToRad;

    cv::Mat rx = (cv::Mat_<double>(3, 3) << 1, 0, 0,
                                            0, std::cos(a), -std::sin(a),
                                            0, std::sin(a), std::cos(a));
    cv::Mat ry = (cv::Mat_<double>(3, 3) << std::cos(b), 0, std::sin(b),
                                            0, 1, 0,
                                            -std::sin(b), 0, std::cos(b));
    cv::Mat rz = (cv::Mat_<double>(3, 3) << std::cos(g), -std::sin(g), 0,
                                            std::sin(g), std::cos(g), 0,
                                            0, 0, 1);
    return rz * ry * rx;
}

std::optional<EulerAngles> HeadPoseEstimator::solve(const std::vector<cv::Point2f>& image_points,
                                                    const cv::Size& frame_size) {
    const auto& object_points = model_points();
    if (image_points.size() != object_points.size() || frame_size.width <= 0 || frame_size.height <= 0) {
        return std::nullopt;
    }

    cv::Mat K = camera_matrix(frame_size);
    // Assume no lens distortion
    cv::Mat dist_coeffs = cv::Mat::zeros(4, 1, CV_64F);
    cv::Mat rvec, tvec;

    cv::Mat rotation;
    try {
        bool success = cv::solvePnP(object_points, image_points, K, dist_coeffs, rvec, tvec, false,
                                    cv::SOLVEPNP_EPNP);
        if (!success || !cv::checkRange(rvec) || !cv::checkRange(tvec)) {
            return std::nullopt;
        }

        // Refine with Levenberg-Marquardt for better accuracy
        cv::solvePnPRefineLM(object_points, image_points, K, dist_coeffs, rvec, tvec);
        if (!cv::checkRange(rvec) || !cv::checkRange(tvec) || tvec.at<double>(2) <= 0.0) {
            return std::nullopt;
        }
        cv::Rodrigues(rvec, rotation);
    } catch (const cv::Exception&) {
        // Degenerate point sets (e.g. all landmarks collapsed) make the solver throw
        return std::nullopt;
    }

    return rotation_to_euler(rotation);
}

PoseEstimate HeadPoseEstimator::estimate(const std::optional<FaceLandmarks>& landmarks,
                                         const RoiInfo& roi) const {
    if (!landmarks || landmarks->points.empty()) {
        return PoseEstimate::no_face(0);
    }

    int count = static_cast<int>(landmarks->points.size());
    std::vector<cv::Point2f> image_points;
    image_points.reserve(required_points().size());

    for (FacialPoint point : required_points()) {
        auto it = landmarks->points.find(point);
        if (it == landmarks->points.end()) {
            // PnP needs every model point; a partial face is not usable
            return PoseEstimate::no_face(count);
        }
        image_points.push_back(roi.normalized_to_original(it->second));
    }

    std::optional<EulerAngles> angles = solve(image_points, roi.original_size);
    if (!angles) {
        return PoseEstimate::no_face(count);
    }

    PoseEstimate pose;
    pose.yaw = angles->yaw;
    pose.pitch = angles->pitch;
    pose.roll = angles->roll;
    pose.landmarks_count = count;
    pose.confidence = std::clamp(landmarks->confidence, 0.0f, 1.0f);
    pose.face_detected = true;
    return pose;
}

bool HeadPoseEstimator::is_deviating(double yaw, double pitch, const PoseConfig& config) {
    return std::abs(yaw) > config.yaw_threshold || std::abs(pitch) > config.pitch_threshold;
}

bool HeadPoseEstimator::is_minor_deviation(double yaw, double pitch, const PoseConfig& config) {
    return std::abs(yaw) > config.minor_yaw_threshold || std::abs(pitch) > config.minor_pitch_threshold;
}

DeviationReport HeadPoseEstimator::advance(const PoseEstimate& pose, double timestamp,
                                           DeviationState& state) const {
    return advance(pose, timestamp, state, config_);
}

DeviationReport HeadPoseEstimator::advance(const PoseEstimate& pose, double timestamp,
                                           DeviationState& state, const PoseConfig& config) const {
    DeviationReport report;
    report.face_detected = pose.face_detected;

    if (!pose.face_detected) {
        // Gap: neither accrue nor decay. The timestamp still moves so the
        // absence is not billed as deviation time on the next face frame.
        state.last_update_at = timestamp;
        report.deviating = false;
        report.duration_accumulated = state.duration_accumulated;
        report.phase = state.phase;
        return report;
    }

    double dt = 0.0;
    if (state.last_update_at) {
        dt = std::max(0.0, timestamp - *state.last_update_at);
    }
    state.last_update_at = timestamp;

    size_t window = static_cast<size_t>(std::max(1, config.smoothing_window));
    state.yaw_history.push_back(pose.yaw);
    state.pitch_history.push_back(pose.pitch);
    while (state.yaw_history.size() > window) state.yaw_history.pop_front();
    while (state.pitch_history.size() > window) state.pitch_history.pop_front();

    double yaw = mean_of(state.yaw_history);
    double pitch = mean_of(state.pitch_history);

    bool deviating = is_deviating(yaw, pitch, config);
    if (deviating) {
        state.phase = DeviationPhase::DEVIATING;
        state.duration_accumulated += dt;
    } else {
        state.phase = DeviationPhase::NORMAL;
        state.duration_accumulated *= config.decay_factor;
    }

    report.deviating = deviating;
    report.minor_deviation = is_minor_deviation(yaw, pitch, config);
    report.duration_accumulated = state.duration_accumulated;
    report.phase = state.phase;
    report.smoothed_yaw = yaw;
    report.smoothed_pitch = pitch;
    return report;
}

} // namespace proctor
