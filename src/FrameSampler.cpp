#include "FrameSampler.hpp"
#include <opencv2/imgproc.hpp>

namespace proctor {

const char* sampling_reason_to_string(SamplingReason reason) {
    switch (reason) {
        case SamplingReason::FIRST_FRAME:       return "first_frame";
        case SamplingReason::MOTION:            return "motion_detected";
        case SamplingReason::MIN_RATE:          return "min_fps_interval";
        case SamplingReason::SAMPLING_DISABLED: return "sampling_disabled";
        case SamplingReason::SKIPPED:           return "skipped";
    }
    return "unknown";
}

double SamplerState::skip_ratio() const {
    if (frames_seen == 0) return 0.0;
    return 1.0 - static_cast<double>(frames_admitted) / static_cast<double>(frames_seen);
}

cv::Mat AdaptiveFrameSampler::to_motion_gray(const cv::Mat& frame, int blur_kernel) {
    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = frame.clone();
    }

    int k = blur_kernel < 1 ? 1 : blur_kernel;
    if (k % 2 == 0) k += 1;

    cv::Mat blurred;
    cv::GaussianBlur(gray, blurred, cv::Size(k, k), 0);
    return blurred;
}

double AdaptiveFrameSampler::motion_score(const cv::Mat& previous_gray, const cv::Mat& current_gray) {
    cv::Mat diff;
    cv::absdiff(previous_gray, current_gray, diff);
    return cv::mean(diff)[0];
}

SamplingDecision AdaptiveFrameSampler::decide(const cv::Mat& frame,
                                              double now,
                                              SamplerState& state,
                                              const SamplerConfig& config) {
    SamplingDecision decision;
    state.frames_seen++;

    cv::Mat gray = to_motion_gray(frame, config.blur_kernel);

    // A resolution change invalidates the reference frame
    bool comparable = state.has_previous() &&
                      state.previous_gray.size() == gray.size() &&
                      state.previous_gray.type() == gray.type();

    if (comparable) {
        decision.motion_score = motion_score(state.previous_gray, gray);
        decision.elapsed = now - state.last_processed_at;
    }

    if (!config.enable_adaptive_sampling) {
        decision.admit = true;
        decision.reason = SamplingReason::SAMPLING_DISABLED;
    } else if (!comparable) {
        decision.admit = true;
        decision.reason = SamplingReason::FIRST_FRAME;
    } else {
        double min_interval = config.max_fps > 0.0 ? 1.0 / config.max_fps : 0.0;
        double max_interval = config.min_fps > 0.0 ? 1.0 / config.min_fps : 0.0;

        if (decision.motion_score > config.motion_threshold && decision.elapsed >= min_interval) {
            decision.admit = true;
            decision.reason = SamplingReason::MOTION;
        } else if (decision.elapsed >= max_interval) {
            decision.admit = true;
            decision.reason = SamplingReason::MIN_RATE;
        } else {
            decision.admit = false;
            decision.reason = SamplingReason::SKIPPED;
        }
    }

    if (decision.admit) {
        state.previous_gray = gray;
        state.last_processed_at = now;
        state.frames_admitted++;
    }

    return decision;
}

} // namespace proctor
