#pragma once

#include "DetectionCoordinator.hpp"
#include "Frame.hpp"
#include "HeadPoseEstimator.hpp"
#include "PipelineConfig.hpp"
#include "PipelineResult.hpp"
#include "Preprocessor.hpp"
#include "Providers.hpp"
#include "RiskScorer.hpp"
#include "SessionRegistry.hpp"
#include "StatsService.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

namespace proctor {

/**
 * @brief Lifetime view of one session, for the session layer
 */
struct SessionSummary {
    std::string session_id;
    uint64_t frames_submitted = 0;
    uint64_t frames_processed = 0;
    uint64_t frames_skipped = 0;
    uint64_t frames_degraded = 0;
    double skip_ratio = 0.0;
    double deviation_duration = 0.0;
    double session_seconds = 0.0;     // Wall clock since start_session
    SessionStatistics behavior;
    std::optional<RiskAssessment> last_assessment;

    nlohmann::json to_json() const;
};

/**
 * @brief Per-session frame pipeline
 *
 * sample -> preprocess -> (pose || objects) -> deviation -> window -> score
 *
 * process() is safe to call from many threads at once. Calls for the same
 * session are serialized; calls for different sessions only share the
 * registry. Each session runs its branches on its own executor, so a provider
 * that overruns its deadline for one session never delays another. Ending
 * such a session waits for the provider to return.
 */
class ProctorPipeline {
public:
    /**
     * @throws std::invalid_argument if the configuration does not validate
     */
    ProctorPipeline(const PipelineConfig& config,
                    std::shared_ptr<LandmarkProvider> landmark_provider,
                    std::shared_ptr<ObjectDetector> object_detector);

    ~ProctorPipeline();

    ProctorPipeline(const ProctorPipeline&) = delete;
    ProctorPipeline& operator=(const ProctorPipeline&) = delete;

    /**
     * @brief Register a session; frames for unknown sessions are rejected
     * @param error Receives the reason on failure (optional)
     */
    bool start_session(const std::string& session_id, std::string* error = nullptr);

    /**
     * @brief Run one frame through the pipeline
     * @throws FrameRejected for malformed frames, unknown sessions, or a
     *         session that ended while the frame was in flight
     */
    PipelineResult process(const std::string& session_id, const cv::Mat& frame, double capture_timestamp);

    /**
     * @brief Same, with per-call configuration (worker_threads and session limits ignored)
     * @throws std::invalid_argument if the override does not validate
     */
    PipelineResult process(const std::string& session_id, const cv::Mat& frame, double capture_timestamp,
                           const PipelineConfig& config);

    PipelineResult process(const Frame& frame);

    /**
     * @brief Release all state of a session and cancel its in-flight frame
     * @return false if the session was not active
     */
    bool end_session(const std::string& session_id);

    /**
     * @brief End every active session
     */
    void end_all_sessions();

    std::optional<SessionSummary> session_statistics(const std::string& session_id) const;

    bool has_session(const std::string& session_id) const;
    size_t active_sessions() const;

    nlohmann::json pipeline_info() const;

    const PipelineConfig& config() const { return config_; }
    StatsService& stats() { return stats_; }
    const StatsService& stats() const { return stats_; }

private:
    std::shared_ptr<SessionState> lookup_for(const Frame& frame);
    PipelineResult run_frame(SessionState& session, const Frame& frame, const PipelineConfig& config);

    PipelineConfig config_;
    std::unique_ptr<DetectionCoordinator> coordinator_;

    Preprocessor preprocessor_;
    HeadPoseEstimator pose_estimator_;
    RiskScorer scorer_;

    SessionRegistry registry_;
    StatsService stats_;
};

} // namespace proctor
