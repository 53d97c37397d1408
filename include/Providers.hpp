#pragma once

#include <opencv2/core.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace proctor {

/**
 * @brief Cooperative cancellation handed to detector providers
 *
 * A token is cancelled when it is cancelled explicitly, when the owning
 * session ends, or when its deadline has passed. Copies share state.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Token that is never cancelled (for direct calls and tests)
     */
    CancellationToken();

    /**
     * @brief Token bound to a deadline and optionally to a session flag
     */
    CancellationToken(Clock::time_point deadline,
                      std::shared_ptr<const std::atomic<bool>> session_flag = nullptr);

    void cancel();
    bool is_cancelled() const;
    bool deadline_passed() const;
    bool session_ended() const;

    bool has_deadline() const { return has_deadline_; }
    Clock::time_point deadline() const { return deadline_; }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::shared_ptr<const std::atomic<bool>> session_flag_;
    Clock::time_point deadline_;
    bool has_deadline_ = false;
};

/**
 * @brief Facial points used for head pose. Left/right are image sides.
 */
enum class FacialPoint {
    NOSE_TIP,
    CHIN,
    LEFT_EYE_CORNER,
    RIGHT_EYE_CORNER,
    LEFT_MOUTH_CORNER,
    RIGHT_MOUTH_CORNER
};

const char* facial_point_to_string(FacialPoint point);
bool facial_point_from_string(const std::string& name, FacialPoint* point);

/**
 * @brief Landmarks for one face, normalized to [0,1]^2 of the image the
 *        provider was given
 */
struct FaceLandmarks {
    std::map<FacialPoint, cv::Point2f> points;
    float confidence = 1.0f;

    bool has(FacialPoint point) const { return points.count(point) > 0; }
};

/**
 * @brief One detector output box, in pixels of the image the detector saw
 */
struct RawDetection {
    int class_id = -1;
    std::string class_name;
    float confidence = 0.0f;
    cv::Rect2f bbox;
};

/**
 * @brief Identifies the frame a provider call belongs to
 */
struct FrameContext {
    std::string session_id;
    uint64_t frame_index = 0;        // Per-session count of submitted frames
    double capture_timestamp = 0.0;
};

/**
 * @brief Abstract facial landmark extractor
 *
 * Implementations are called concurrently from worker threads for different
 * sessions and must be thread-safe. Long-running implementations should poll
 * the token and return early once it is cancelled.
 */
class LandmarkProvider {
public:
    virtual ~LandmarkProvider() = default;

    /**
     * @brief Locate facial landmarks
     * @return Landmarks of the primary face, or std::nullopt if no face
     * @throws std::exception on provider failure
     */
    virtual std::optional<FaceLandmarks> detect(const cv::Mat& image,
                                                const FrameContext& context,
                                                const CancellationToken& token) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Abstract object detector (NMS already applied)
 *
 * Same threading and cancellation contract as LandmarkProvider.
 */
class ObjectDetector {
public:
    virtual ~ObjectDetector() = default;

    virtual std::vector<RawDetection> detect(const cv::Mat& image,
                                             const FrameContext& context,
                                             const CancellationToken& token) = 0;

    virtual std::string name() const = 0;
};

} // namespace proctor
