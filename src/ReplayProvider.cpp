#include "ReplayProvider.hpp"

#include <opencv2/calib3d.hpp>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <thread>

namespace proctor {

namespace {

using nlohmann::json;

cv::Rect2f parse_bbox(const json& j) {
    if (!j.is_array() || j.size() != 4) {
        throw std::invalid_argument("bbox must be [x, y, width, height]");
    }
    return cv::Rect2f(j[0].get<float>(), j[1].get<float>(), j[2].get<float>(), j[3].get<float>());
}

ScriptedFrame parse_frame(const json& j) {
    ScriptedFrame f;
    f.frame = j.value("frame", static_cast<uint64_t>(1));
    f.face = j.value("face", true);
    f.landmark_confidence = j.value("landmark_confidence", 1.0f);
    f.landmark_delay_ms = j.value("landmark_delay_ms", 0);
    f.detection_delay_ms = j.value("detection_delay_ms", 0);
    f.landmark_error = j.value("landmark_error", "");
    f.detection_error = j.value("detection_error", "");

    if (j.contains("pose")) {
        const json& p = j.at("pose");
        EulerAngles angles;
        angles.yaw = p.value("yaw", 0.0);
        angles.pitch = p.value("pitch", 0.0);
        angles.roll = p.value("roll", 0.0);
        f.pose = angles;
    }

    if (j.contains("landmarks")) {
        for (const auto& item : j.at("landmarks").items()) {
            FacialPoint point;
            if (!facial_point_from_string(item.key(), &point)) {
                throw std::invalid_argument("unknown landmark: " + item.key());
            }
            const json& xy = item.value();
            if (!xy.is_array() || xy.size() != 2) {
                throw std::invalid_argument("landmark " + item.key() + " must be [x, y]");
            }
            f.points[point] = cv::Point2f(xy[0].get<float>(), xy[1].get<float>());
        }
    }

    if (j.contains("detections")) {
        for (const auto& d : j.at("detections")) {
            RawDetection det;
            det.class_id = d.value("class_id", -1);
            det.class_name = d.value("class_name", "");
            det.confidence = d.value("confidence", 0.0f);
            det.bbox = parse_bbox(d.at("bbox"));
            f.detections.push_back(det);
        }
    }
    return f;
}

} // namespace

ReplayScript::ReplayScript(std::vector<ScriptedFrame> frames)
    : frames_(std::move(frames)) {
    std::stable_sort(frames_.begin(), frames_.end(),
                     [](const ScriptedFrame& a, const ScriptedFrame& b) { return a.frame < b.frame; });
}

ReplayScript ReplayScript::from_json(const json& j) {
    if (!j.contains("frames") || !j.at("frames").is_array()) {
        throw std::invalid_argument("script needs a \"frames\" array");
    }

    std::vector<ScriptedFrame> frames;
    for (const auto& entry : j.at("frames")) {
        frames.push_back(parse_frame(entry));
    }
    return ReplayScript(std::move(frames));
}

bool ReplayScript::load_from_file(const std::string& path, ReplayScript& out, std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (error) *error = "cannot open script: " + path;
        return false;
    }

    try {
        json j;
        file >> j;
        out = from_json(j);
    } catch (const json::exception& e) {
        if (error) *error = std::string("invalid script JSON: ") + e.what();
        return false;
    } catch (const std::invalid_argument& e) {
        if (error) *error = std::string("invalid script: ") + e.what();
        return false;
    }
    return true;
}

const ScriptedFrame* ReplayScript::lookup(uint64_t frame_index) const {
    // Last entry at or before frame_index
    auto it = std::upper_bound(frames_.begin(), frames_.end(), frame_index,
                               [](uint64_t index, const ScriptedFrame& f) { return index < f.frame; });
    if (it == frames_.begin()) {
        return nullptr;
    }
    return &*std::prev(it);
}

FaceLandmarks synthesize_landmarks(const EulerAngles& pose, const cv::Size& image_size, double distance) {
    cv::Mat rotation = HeadPoseEstimator::euler_to_rotation(pose);
    cv::Mat rvec;
    cv::Rodrigues(rotation, rvec);
    cv::Mat tvec = (cv::Mat_<double>(3, 1) << 0.0, 0.0, distance);

    std::vector<cv::Point2f> projected;
    cv::projectPoints(HeadPoseEstimator::model_points(), rvec, tvec,
                      HeadPoseEstimator::camera_matrix(image_size),
                      cv::Mat::zeros(4, 1, CV_64F), projected);

    FaceLandmarks landmarks;
    const auto& order = HeadPoseEstimator::required_points();
    for (size_t i = 0; i < order.size() && i < projected.size(); ++i) {
        landmarks.points[order[i]] = cv::Point2f(projected[i].x / image_size.width,
                                                 projected[i].y / image_size.height);
    }
    return landmarks;
}

bool cooperative_sleep(int delay_ms, const CancellationToken& token) {
    auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
    while (std::chrono::steady_clock::now() < until) {
        if (token.is_cancelled()) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return !token.is_cancelled();
}

ReplayLandmarkProvider::ReplayLandmarkProvider(std::shared_ptr<const ReplayScript> script)
    : script_(std::move(script)) {
}

std::optional<FaceLandmarks> ReplayLandmarkProvider::detect(const cv::Mat& image,
                                                            const FrameContext& context,
                                                            const CancellationToken& token) {
    const ScriptedFrame* entry = script_ ? script_->lookup(context.frame_index) : nullptr;
    if (!entry) {
        return std::nullopt;
    }

    if (entry->landmark_delay_ms > 0 && !cooperative_sleep(entry->landmark_delay_ms, token)) {
        return std::nullopt;
    }
    if (!entry->landmark_error.empty()) {
        throw std::runtime_error(entry->landmark_error);
    }
    if (!entry->face) {
        return std::nullopt;
    }

    FaceLandmarks landmarks;
    if (entry->pose) {
        landmarks = synthesize_landmarks(*entry->pose, image.size());
    } else {
        landmarks.points = entry->points;
    }
    landmarks.confidence = entry->landmark_confidence;
    return landmarks;
}

ReplayObjectDetector::ReplayObjectDetector(std::shared_ptr<const ReplayScript> script)
    : script_(std::move(script)) {
}

std::vector<RawDetection> ReplayObjectDetector::detect(const cv::Mat& image,
                                                       const FrameContext& context,
                                                       const CancellationToken& token) {
    (void)image;
    const ScriptedFrame* entry = script_ ? script_->lookup(context.frame_index) : nullptr;
    if (!entry) {
        return {};
    }

    if (entry->detection_delay_ms > 0 && !cooperative_sleep(entry->detection_delay_ms, token)) {
        return {};
    }
    if (!entry->detection_error.empty()) {
        throw std::runtime_error(entry->detection_error);
    }
    return entry->detections;
}

} // namespace proctor
