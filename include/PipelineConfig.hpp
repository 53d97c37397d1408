#pragma once

#include "BehaviorWindow.hpp"
#include "FrameSampler.hpp"
#include "HeadPoseEstimator.hpp"
#include "ObjectSignalFilter.hpp"
#include "Preprocessor.hpp"
#include "RiskScorer.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace proctor {

/**
 * @brief Fan-out settings
 */
struct DetectionConfig {
    int timeout_ms = 150;         // Shared deadline for both branches
    size_t worker_threads = 2;    // Branch threads per session, fixed at start_session
};

/**
 * @brief Everything the pipeline can be tuned with
 *
 * Loaded from JSON. Flat top-level keys (enable_roi, motion_threshold,
 * timeout_ms, window_size, ...) and nested sections ("sampling",
 * "preprocessing", "pose", "objects", "detection", "behavior", "scoring")
 * are both accepted; a nested value wins over its flat alias.
 */
struct PipelineConfig {
    SamplerConfig sampling;
    PreprocessConfig preprocessing;
    PoseConfig pose;
    ObjectFilterConfig objects;
    DetectionConfig detection;
    PatternConfig patterns;
    ScoringConfig scoring;

    int window_size = 30;
    size_t max_sessions = 10;          // 0 = unlimited
    size_t session_queue_size = 8;     // Frames buffered per SessionRunner
    int stats_interval_ms = 0;         // Periodic stats log, 0 = off
    bool verbose_logging = false;

    /**
     * @brief Check ranges and cross-field constraints
     * @param error Receives the first problem found (optional)
     * @return true if the configuration is usable
     */
    bool validate(std::string* error = nullptr) const;

    nlohmann::json to_json() const;

    /**
     * @brief Overlay values present in j onto the defaults
     * @throws nlohmann::json::exception on a wrongly typed value
     */
    static PipelineConfig from_json(const nlohmann::json& j);

    /**
     * @brief Overlay values present in j onto base
     */
    static PipelineConfig from_json(const nlohmann::json& j, const PipelineConfig& base);

    /**
     * @brief Load and validate a JSON config file
     * @return false with a message if the file is missing, unparsable or invalid
     */
    static bool load_from_file(const std::string& path, PipelineConfig& out, std::string* error = nullptr);
};

} // namespace proctor
