#include "DetectionCoordinator.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <utility>

namespace proctor {

namespace {

// Granularity at which a pending join notices that its session ended
constexpr std::chrono::milliseconds kJoinPollInterval(5);

template<typename T>
struct BranchValue {
    std::optional<T> value;    // Empty when the branch gave up on its token
    double elapsed_ms = 0.0;
};

double ms_since(DetectionCoordinator::Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(DetectionCoordinator::Clock::now() - start).count();
}

template<typename T>
bool is_ready(std::future<T>& future) {
    return future.valid() &&
           future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

template<typename T>
void collect_branch(std::future<BranchValue<T>>& future,
                    bool done,
                    bool session_ended,
                    double waited_ms,
                    int timeout_ms,
                    T& value,
                    BranchReport& report) {
    if (!done) {
        report.elapsed_ms = waited_ms;
        if (session_ended) {
            report.status = BranchStatus::CANCELLED;
            report.error = "session ended";
        } else {
            report.status = BranchStatus::TIMEOUT;
            report.error = "no result within " + std::to_string(timeout_ms) + " ms";
        }
        return;
    }

    try {
        BranchValue<T> result = future.get();
        report.elapsed_ms = result.elapsed_ms;
        if (!result.value) {
            report.status = session_ended ? BranchStatus::CANCELLED : BranchStatus::TIMEOUT;
            report.error = "cancelled by deadline";
            return;
        }
        value = std::move(*result.value);
        report.status = BranchStatus::OK;
    } catch (const std::exception& e) {
        report.status = BranchStatus::FAILED;
        report.error = e.what();
        report.elapsed_ms = waited_ms;
    }
}

} // namespace

const char* branch_status_to_string(BranchStatus status) {
    switch (status) {
        case BranchStatus::OK:        return "ok";
        case BranchStatus::TIMEOUT:   return "timeout";
        case BranchStatus::FAILED:    return "failed";
        case BranchStatus::CANCELLED: return "cancelled";
        case BranchStatus::NOT_RUN:   return "not_run";
    }
    return "unknown";
}

DetectionCoordinator::DetectionCoordinator(std::shared_ptr<LandmarkProvider> landmark_provider,
                                           std::shared_ptr<ObjectDetector> object_detector,
                                           bool verbose)
    : landmark_provider_(std::move(landmark_provider)),
      object_detector_(std::move(object_detector)),
      verbose_(verbose) {
}

std::string DetectionCoordinator::landmark_provider_name() const {
    return landmark_provider_ ? landmark_provider_->name() : "none";
}

std::string DetectionCoordinator::object_detector_name() const {
    return object_detector_ ? object_detector_->name() : "none";
}

DetectionOutcome DetectionCoordinator::run(WorkerPool& executor,
                                           const PreprocessedFrame& frame,
                                           const FrameContext& context,
                                           int timeout_ms,
                                           const ObjectFilterConfig& filter_config,
                                           std::shared_ptr<const std::atomic<bool>> session_flag) {
    LandmarkFn landmark_fn;
    if (landmark_provider_) {
        // Captured by value: an abandoned branch may outlive this call
        landmark_fn = [provider = landmark_provider_, image = frame.image, context]
                      (const CancellationToken& token) {
            return provider->detect(image, context, token);
        };
    }

    DetectionFn detection_fn;
    if (object_detector_) {
        detection_fn = [detector = object_detector_, image = frame.image, context]
                       (const CancellationToken& token) {
            return detector->detect(image, context, token);
        };
    }

    return execute(executor, frame, context, timeout_ms, filter_config, std::move(session_flag),
                   std::move(landmark_fn), std::move(detection_fn));
}

DetectionOutcome DetectionCoordinator::run(WorkerPool& executor,
                                           const PreprocessedFrame& frame,
                                           const FrameContext& context,
                                           const std::optional<FaceLandmarks>& landmarks,
                                           const std::optional<std::vector<RawDetection>>& detections,
                                           int timeout_ms,
                                           const ObjectFilterConfig& filter_config) {
    LandmarkFn landmark_fn = [landmarks](const CancellationToken&) {
        return landmarks;
    };

    DetectionFn detection_fn;
    if (detections) {
        detection_fn = [list = *detections](const CancellationToken&) {
            return list;
        };
    }

    return execute(executor, frame, context, timeout_ms, filter_config, nullptr,
                   std::move(landmark_fn), std::move(detection_fn));
}

DetectionOutcome DetectionCoordinator::execute(WorkerPool& executor,
                                               const PreprocessedFrame& frame,
                                               const FrameContext& context,
                                               int timeout_ms,
                                               const ObjectFilterConfig& filter_config,
                                               std::shared_ptr<const std::atomic<bool>> session_flag,
                                               LandmarkFn landmark_fn,
                                               DetectionFn detection_fn) {
    auto start = Clock::now();
    auto deadline = start + std::chrono::milliseconds(std::max(0, timeout_ms));
    CancellationToken token(deadline, std::move(session_flag));

    DetectionOutcome outcome;
    outcome.pose = PoseEstimate::no_face(0);
    outcome.objects = ObjectSignal::empty();

    // ---- Fan-out ----
    std::future<BranchValue<PoseEstimate>> pose_future;
    if (landmark_fn) {
        RoiInfo roi = frame.roi;
        pose_future = executor.submit([landmark_fn, roi, token]() {
            BranchValue<PoseEstimate> out;
            if (token.is_cancelled()) return out;   // Dequeued after the deadline

            auto branch_start = Clock::now();
            std::optional<FaceLandmarks> landmarks = landmark_fn(token);
            if (token.is_cancelled()) return out;

            HeadPoseEstimator estimator;
            out.value = estimator.estimate(landmarks, roi);
            out.elapsed_ms = ms_since(branch_start);
            return out;
        });
    }

    std::future<BranchValue<ObjectSignal>> object_future;
    if (detection_fn) {
        RoiInfo roi = frame.roi;
        object_future = executor.submit([detection_fn, roi, filter_config, token]() {
            BranchValue<ObjectSignal> out;
            if (token.is_cancelled()) return out;

            auto branch_start = Clock::now();
            std::vector<RawDetection> detections = detection_fn(token);
            if (token.is_cancelled()) return out;

            ObjectSignalFilter filter(filter_config);
            out.value = filter.filter(detections, roi);
            out.elapsed_ms = ms_since(branch_start);
            return out;
        });
    }

    // ---- Fan-in under one deadline ----
    bool pose_done = !pose_future.valid();
    bool object_done = !object_future.valid();

    while (true) {
        if (!pose_done) pose_done = is_ready(pose_future);
        if (!object_done) object_done = is_ready(object_future);
        if (pose_done && object_done) break;

        if (token.session_ended()) {
            outcome.cancelled = true;
            break;
        }

        auto now = Clock::now();
        if (now >= deadline) break;

        auto slice = std::min<Clock::duration>(kJoinPollInterval, deadline - now);
        if (!pose_done) {
            pose_future.wait_for(slice);
        } else {
            object_future.wait_for(slice);
        }
    }

    // Providers may notice the ended session before the loop does
    if (token.session_ended()) {
        outcome.cancelled = true;
    }

    // Anything still running sees the cancellation and its result is dropped
    token.cancel();
    double waited_ms = ms_since(start);

    if (landmark_fn) {
        collect_branch(pose_future, pose_done, outcome.cancelled, waited_ms, timeout_ms,
                       outcome.pose, outcome.pose_branch);
    } else {
        outcome.pose_branch.status = BranchStatus::NOT_RUN;
        outcome.pose_branch.error = "no landmark provider";
    }

    if (detection_fn) {
        collect_branch(object_future, object_done, outcome.cancelled, waited_ms, timeout_ms,
                       outcome.objects, outcome.object_branch);
    } else {
        outcome.object_branch.status = BranchStatus::NOT_RUN;
        outcome.object_branch.error = "no object detector";
    }

    // Degraded branches fall back to their explicit defaults
    if (outcome.pose_branch.degraded()) outcome.pose = PoseEstimate::no_face(0);
    if (outcome.object_branch.degraded()) outcome.objects = ObjectSignal::empty();

    outcome.elapsed_ms = waited_ms;

    log_degraded(context, "pose", outcome.pose_branch);
    log_degraded(context, "object", outcome.object_branch);

    return outcome;
}

void DetectionCoordinator::log_degraded(const FrameContext& context, const char* branch,
                                        const BranchReport& report) const {
    switch (report.status) {
        case BranchStatus::TIMEOUT:
        case BranchStatus::FAILED:
            std::cerr << "[DetectionCoordinator] Session " << context.session_id
                      << " frame " << context.frame_index << ": " << branch << " branch "
                      << branch_status_to_string(report.status) << " (" << report.error << ")"
                      << std::endl;
            break;
        case BranchStatus::CANCELLED:
            if (verbose_) {
                std::cout << "[DetectionCoordinator] Session " << context.session_id
                          << " frame " << context.frame_index << ": " << branch
                          << " branch cancelled" << std::endl;
            }
            break;
        default:
            break;
    }
}

} // namespace proctor
