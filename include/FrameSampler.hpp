#pragma once

#include <opencv2/core.hpp>
#include <cstdint>

namespace proctor {

/**
 * @brief Admission control settings
 */
struct SamplerConfig {
    bool enable_adaptive_sampling = true;
    double motion_threshold = 10.0;   // Mean absolute difference, 0-255 scale
    double min_fps = 2.0;             // Floor rate, even for a static scene
    double max_fps = 10.0;            // Ceiling rate, even under motion
    int blur_kernel = 21;             // Gaussian kernel before differencing (forced odd)
};

enum class SamplingReason {
    FIRST_FRAME,        // No reference frame yet, session bootstrap
    MOTION,             // Motion above threshold and min interval elapsed
    MIN_RATE,           // Static scene but max interval elapsed
    SAMPLING_DISABLED,  // Pass-through mode
    SKIPPED             // Not admitted
};

const char* sampling_reason_to_string(SamplingReason reason);

/**
 * @brief Per-session sampler state (owned by the session registry)
 */
struct SamplerState {
    cv::Mat previous_gray;            // Blurred intensity of last admitted frame
    double last_processed_at = 0.0;
    uint64_t frames_seen = 0;
    uint64_t frames_admitted = 0;

    bool has_previous() const { return !previous_gray.empty(); }
    double skip_ratio() const;
};

struct SamplingDecision {
    bool admit = false;
    double motion_score = 0.0;
    double elapsed = 0.0;             // Seconds since last admitted frame
    SamplingReason reason = SamplingReason::SKIPPED;
};

/**
 * @brief Motion-gated frame admission
 *
 * Admits a frame when there is enough motion and the rate ceiling allows it,
 * or when the rate floor forces it. The first frame of a session is always
 * admitted. A skip leaves the state untouched apart from the counters.
 */
class AdaptiveFrameSampler {
public:
    /**
     * @brief Decide whether a frame should be processed
     * @param frame BGR frame
     * @param now Capture timestamp in seconds
     * @param state Session sampler state, updated on admission
     * @param config Thresholds
     */
    static SamplingDecision decide(const cv::Mat& frame,
                                   double now,
                                   SamplerState& state,
                                   const SamplerConfig& config);

    /**
     * @brief Blurred single channel intensity used for differencing
     */
    static cv::Mat to_motion_gray(const cv::Mat& frame, int blur_kernel);

    /**
     * @brief Mean absolute difference between two motion images (0-255)
     */
    static double motion_score(const cv::Mat& previous_gray, const cv::Mat& current_gray);
};

} // namespace proctor
