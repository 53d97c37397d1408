#pragma once

#include "BehaviorWindow.hpp"
#include "DetectionCoordinator.hpp"
#include "FrameSampler.hpp"
#include "HeadPoseEstimator.hpp"
#include "ObjectSignalFilter.hpp"
#include "RiskScorer.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace proctor {

/**
 * @brief Per-stage wall clock timings in milliseconds
 */
struct StageTimings {
    double sampling_ms = 0.0;
    double preprocess_ms = 0.0;
    double pose_ms = 0.0;
    double object_ms = 0.0;
    double detection_ms = 0.0;   // Whole fan-out/fan-in
    double behavior_ms = 0.0;
    double scoring_ms = 0.0;
    double total_ms = 0.0;
};

struct ProcessingMetadata {
    std::string session_id;
    double capture_timestamp = 0.0;
    uint64_t frame_index = 0;           // Submitted frames, 1-based
    uint64_t processed_index = 0;       // Admitted frames, 1-based

    bool frame_skipped = false;
    double motion_score = 0.0;
    SamplingReason sampling_reason = SamplingReason::SKIPPED;

    StageTimings timings;
    BranchReport pose_branch;
    BranchReport object_branch;

    bool roi_applied = false;
    std::vector<std::string> preprocessing_stages;

    /**
     * @brief True if either detection branch fell back to its default
     */
    bool degraded() const { return pose_branch.degraded() || object_branch.degraded(); }
};

/**
 * @brief Everything produced for one submitted frame
 */
struct PipelineResult {
    PoseEstimate pose;
    DeviationReport deviation;
    ObjectSignal objects;
    BehaviorSnapshot behavior;
    RiskAssessment risk;
    ProcessingMetadata metadata;

    nlohmann::json to_json() const;
};

nlohmann::json to_json(const PoseEstimate& pose);
nlohmann::json to_json(const DeviationReport& deviation);
nlohmann::json to_json(const ObjectSignal& objects);
nlohmann::json to_json(const BehaviorSnapshot& behavior);
nlohmann::json to_json(const RiskAssessment& risk);
nlohmann::json to_json(const ProcessingMetadata& metadata);
nlohmann::json to_json(const SessionStatistics& stats);

} // namespace proctor
