#pragma once

#include "HeadPoseEstimator.hpp"
#include "Providers.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace proctor {

/**
 * @brief What the providers report for one scripted frame
 *
 * Landmarks come either from explicit normalized points or from a head pose
 * that is projected through the canonical face model.
 */
struct ScriptedFrame {
    uint64_t frame = 1;                       // First submitted frame index it applies to

    bool face = true;
    std::map<FacialPoint, cv::Point2f> points;
    std::optional<EulerAngles> pose;
    float landmark_confidence = 1.0f;

    std::vector<RawDetection> detections;

    int landmark_delay_ms = 0;
    int detection_delay_ms = 0;
    std::string landmark_error;               // Non-empty: provider throws
    std::string detection_error;
};

/**
 * @brief Immutable frame script shared by the replay providers
 *
 * {"frames": [{"frame": 1, "pose": {"yaw": 0, "pitch": 0, "roll": 0},
 *              "detections": [{"class_name": "cell phone", "confidence": 0.8,
 *                              "bbox": [x, y, w, h]}]},
 *             {"frame": 40, "face": false}]}
 *
 * An entry holds until the next entry's frame index.
 */
class ReplayScript {
public:
    ReplayScript() = default;
    explicit ReplayScript(std::vector<ScriptedFrame> frames);

    /**
     * @throws nlohmann::json::exception or std::invalid_argument on a malformed script
     */
    static ReplayScript from_json(const nlohmann::json& j);

    static bool load_from_file(const std::string& path, ReplayScript& out, std::string* error = nullptr);

    /**
     * @brief Entry in effect for a frame index, nullptr before the first entry
     */
    const ScriptedFrame* lookup(uint64_t frame_index) const;

    size_t size() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }

private:
    std::vector<ScriptedFrame> frames_;       // Sorted by frame
};

/**
 * @brief Landmarks for a head pose, normalized to an image of the given size
 * @param distance Nose tip distance from the camera (model units)
 */
FaceLandmarks synthesize_landmarks(const EulerAngles& pose, const cv::Size& image_size, double distance = 600.0);

/**
 * @brief Sleep up to delay_ms, returning early once the token is cancelled
 * @return false if the token was cancelled
 */
bool cooperative_sleep(int delay_ms, const CancellationToken& token);

class ReplayLandmarkProvider : public LandmarkProvider {
public:
    explicit ReplayLandmarkProvider(std::shared_ptr<const ReplayScript> script);

    std::optional<FaceLandmarks> detect(const cv::Mat& image,
                                        const FrameContext& context,
                                        const CancellationToken& token) override;

    std::string name() const override { return "replay-landmarks"; }

private:
    std::shared_ptr<const ReplayScript> script_;
};

class ReplayObjectDetector : public ObjectDetector {
public:
    explicit ReplayObjectDetector(std::shared_ptr<const ReplayScript> script);

    std::vector<RawDetection> detect(const cv::Mat& image,
                                     const FrameContext& context,
                                     const CancellationToken& token) override;

    std::string name() const override { return "replay-objects"; }

private:
    std::shared_ptr<const ReplayScript> script_;
};

} // namespace proctor
