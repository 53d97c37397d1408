#pragma once

#include "HeadPoseEstimator.hpp"
#include "ObjectSignalFilter.hpp"
#include "Preprocessor.hpp"
#include "Providers.hpp"
#include "WorkerPool.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace proctor {

/**
 * @brief How one detection branch ended
 */
enum class BranchStatus {
    OK,
    TIMEOUT,     // Did not finish before the shared deadline
    FAILED,      // Provider or estimator threw
    CANCELLED,   // Session ended while the branch was pending
    NOT_RUN      // No provider configured
};

const char* branch_status_to_string(BranchStatus status);

struct BranchReport {
    BranchStatus status = BranchStatus::NOT_RUN;
    std::string error;
    double elapsed_ms = 0.0;

    bool degraded() const { return status != BranchStatus::OK; }
};

/**
 * @brief Joined result of the pose and object branches
 *
 * A degraded branch carries its default (no face / empty signal); the other
 * branch's result is kept as produced.
 */
struct DetectionOutcome {
    PoseEstimate pose;
    ObjectSignal objects;
    BranchReport pose_branch;
    BranchReport object_branch;
    bool cancelled = false;     // Session ended during the join
    double elapsed_ms = 0.0;
};

/**
 * @brief Concurrent pose / object detection with one shared deadline
 *
 * Both branches are queued on the executor the caller passes, normally the
 * session's own. The caller waits at most timeout_ms for both; a branch still
 * running at the deadline is abandoned and sees its token cancelled. Branches
 * never touch per-session state.
 *
 * A provider exception derived from std::exception fails its branch only.
 * Anything else is rethrown from run().
 */
class DetectionCoordinator {
public:
    using Clock = std::chrono::steady_clock;

    using LandmarkFn = std::function<std::optional<FaceLandmarks>(const CancellationToken&)>;
    using DetectionFn = std::function<std::vector<RawDetection>(const CancellationToken&)>;

    DetectionCoordinator(std::shared_ptr<LandmarkProvider> landmark_provider,
                         std::shared_ptr<ObjectDetector> object_detector,
                         bool verbose = false);

    /**
     * @brief Run both providers on a preprocessed frame
     * @param session_flag Raised by end_session(); aborts the join early
     */
    DetectionOutcome run(WorkerPool& executor,
                         const PreprocessedFrame& frame,
                         const FrameContext& context,
                         int timeout_ms,
                         const ObjectFilterConfig& filter_config,
                         std::shared_ptr<const std::atomic<bool>> session_flag = nullptr);

    /**
     * @brief Run the pose and object consumers on already extracted inputs
     *
     * nullopt detections mark the object branch as not run.
     */
    DetectionOutcome run(WorkerPool& executor,
                         const PreprocessedFrame& frame,
                         const FrameContext& context,
                         const std::optional<FaceLandmarks>& landmarks,
                         const std::optional<std::vector<RawDetection>>& detections,
                         int timeout_ms,
                         const ObjectFilterConfig& filter_config);

    bool has_landmark_provider() const { return landmark_provider_ != nullptr; }
    bool has_object_detector() const { return object_detector_ != nullptr; }
    std::string landmark_provider_name() const;
    std::string object_detector_name() const;

private:
    DetectionOutcome execute(WorkerPool& executor,
                             const PreprocessedFrame& frame,
                             const FrameContext& context,
                             int timeout_ms,
                             const ObjectFilterConfig& filter_config,
                             std::shared_ptr<const std::atomic<bool>> session_flag,
                             LandmarkFn landmark_fn,
                             DetectionFn detection_fn);

    void log_degraded(const FrameContext& context, const char* branch, const BranchReport& report) const;

    std::shared_ptr<LandmarkProvider> landmark_provider_;
    std::shared_ptr<ObjectDetector> object_detector_;
    bool verbose_;
};

} // namespace proctor
