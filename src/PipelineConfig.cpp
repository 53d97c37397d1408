#include "PipelineConfig.hpp"

#include <fstream>
#include <stdexcept>

namespace proctor {

namespace {

using nlohmann::json;

template<typename T>
void read(const json& j, const char* key, T& field) {
    if (j.contains(key) && !j.at(key).is_null()) {
        field = j.at(key).get<T>();
    }
}

const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    if (j.contains(key) && j.at(key).is_object()) {
        return j.at(key);
    }
    return empty;
}

bool fail(std::string* error, const std::string& message) {
    if (error) *error = message;
    return false;
}

} // namespace

PipelineConfig PipelineConfig::from_json(const json& j) {
    return from_json(j, PipelineConfig());
}

PipelineConfig PipelineConfig::from_json(const json& j, const PipelineConfig& base) {
    PipelineConfig c = base;
    if (!j.is_object()) {
        throw std::invalid_argument("pipeline config must be a JSON object");
    }

    // Flat keys of the public configuration surface
    read(j, "enable_preprocessing", c.preprocessing.enable_preprocessing);
    read(j, "enable_roi", c.preprocessing.enable_roi);
    read(j, "enable_adaptive_sampling", c.sampling.enable_adaptive_sampling);
    read(j, "motion_threshold", c.sampling.motion_threshold);
    read(j, "min_fps", c.sampling.min_fps);
    read(j, "max_fps", c.sampling.max_fps);
    read(j, "timeout_ms", c.detection.timeout_ms);
    read(j, "window_size", c.window_size);
    read(j, "max_sessions", c.max_sessions);
    read(j, "session_queue_size", c.session_queue_size);
    read(j, "stats_interval_ms", c.stats_interval_ms);
    read(j, "verbose_logging", c.verbose_logging);

    const json& sampling = section(j, "sampling");
    read(sampling, "enable_adaptive_sampling", c.sampling.enable_adaptive_sampling);
    read(sampling, "motion_threshold", c.sampling.motion_threshold);
    read(sampling, "min_fps", c.sampling.min_fps);
    read(sampling, "max_fps", c.sampling.max_fps);
    read(sampling, "blur_kernel", c.sampling.blur_kernel);

    const json& pre = section(j, "preprocessing");
    read(pre, "enable_preprocessing", c.preprocessing.enable_preprocessing);
    read(pre, "enable_clahe", c.preprocessing.enable_clahe);
    read(pre, "enable_denoise", c.preprocessing.enable_denoise);
    read(pre, "enable_gamma", c.preprocessing.enable_gamma);
    read(pre, "enable_roi", c.preprocessing.enable_roi);
    read(pre, "clahe_clip_limit", c.preprocessing.clahe_clip_limit);
    read(pre, "clahe_tile_grid", c.preprocessing.clahe_tile_grid);
    read(pre, "bilateral_diameter", c.preprocessing.bilateral_diameter);
    read(pre, "bilateral_sigma_color", c.preprocessing.bilateral_sigma_color);
    read(pre, "bilateral_sigma_space", c.preprocessing.bilateral_sigma_space);
    read(pre, "gamma", c.preprocessing.gamma);
    read(pre, "roi_ratio", c.preprocessing.roi_ratio);

    const json& pose = section(j, "pose");
    read(pose, "yaw_threshold", c.pose.yaw_threshold);
    read(pose, "pitch_threshold", c.pose.pitch_threshold);
    read(pose, "minor_yaw_threshold", c.pose.minor_yaw_threshold);
    read(pose, "minor_pitch_threshold", c.pose.minor_pitch_threshold);
    read(pose, "decay_factor", c.pose.decay_factor);
    read(pose, "smoothing_window", c.pose.smoothing_window);

    const json& objects = section(j, "objects");
    read(objects, "forbidden_confidence", c.objects.forbidden_confidence);
    read(objects, "person_confidence", c.objects.person_confidence);
    read(objects, "person_class_id", c.objects.person_class_id);
    read(objects, "person_class_name", c.objects.person_class_name);
    if (objects.contains("forbidden_names")) {
        c.objects.forbidden_names = objects.at("forbidden_names").get<std::map<std::string, std::string>>();
    }
    if (objects.contains("forbidden_ids")) {
        // JSON keys are strings: {"67": "phone"}
        c.objects.forbidden_ids.clear();
        for (const auto& item : objects.at("forbidden_ids").items()) {
            c.objects.forbidden_ids[std::stoi(item.key())] = item.value().get<std::string>();
        }
    }

    const json& detection = section(j, "detection");
    read(detection, "timeout_ms", c.detection.timeout_ms);
    read(detection, "worker_threads", c.detection.worker_threads);

    const json& behavior = section(j, "behavior");
    read(behavior, "window_size", c.window_size);
    read(behavior, "frequent_deviation_ratio", c.patterns.frequent_deviation_ratio);
    read(behavior, "repeated_object_ratio", c.patterns.repeated_object_ratio);
    read(behavior, "multiple_person_average", c.patterns.multiple_person_average);

    const json& scoring = section(j, "scoring");
    read(scoring, "gaze_weight", c.scoring.gaze_weight);
    read(scoring, "forbidden_item_weight", c.scoring.forbidden_item_weight);
    read(scoring, "multiple_person_weight", c.scoring.multiple_person_weight);
    read(scoring, "repeated_deviation_weight", c.scoring.repeated_deviation_weight);
    read(scoring, "repeated_object_weight", c.scoring.repeated_object_weight);
    read(scoring, "sustained_gaze_seconds", c.scoring.sustained_gaze_seconds);
    read(scoring, "sustained_gaze_weight", c.scoring.sustained_gaze_weight);
    read(scoring, "max_score", c.scoring.max_score);
    const json& alerts = section(scoring, "alert_thresholds");
    read(alerts, "low", c.scoring.low_max);
    read(alerts, "medium", c.scoring.medium_max);
    read(alerts, "high", c.scoring.high_max);

    return c;
}

nlohmann::json PipelineConfig::to_json() const {
    json forbidden_ids = json::object();
    for (const auto& entry : objects.forbidden_ids) {
        forbidden_ids[std::to_string(entry.first)] = entry.second;
    }

    return {
        {"window_size", window_size},
        {"max_sessions", max_sessions},
        {"session_queue_size", session_queue_size},
        {"stats_interval_ms", stats_interval_ms},
        {"verbose_logging", verbose_logging},
        {"sampling", {
            {"enable_adaptive_sampling", sampling.enable_adaptive_sampling},
            {"motion_threshold", sampling.motion_threshold},
            {"min_fps", sampling.min_fps},
            {"max_fps", sampling.max_fps},
            {"blur_kernel", sampling.blur_kernel}
        }},
        {"preprocessing", {
            {"enable_preprocessing", preprocessing.enable_preprocessing},
            {"enable_clahe", preprocessing.enable_clahe},
            {"enable_denoise", preprocessing.enable_denoise},
            {"enable_gamma", preprocessing.enable_gamma},
            {"enable_roi", preprocessing.enable_roi},
            {"clahe_clip_limit", preprocessing.clahe_clip_limit},
            {"clahe_tile_grid", preprocessing.clahe_tile_grid},
            {"bilateral_diameter", preprocessing.bilateral_diameter},
            {"bilateral_sigma_color", preprocessing.bilateral_sigma_color},
            {"bilateral_sigma_space", preprocessing.bilateral_sigma_space},
            {"gamma", preprocessing.gamma},
            {"roi_ratio", preprocessing.roi_ratio}
        }},
        {"pose", {
            {"yaw_threshold", pose.yaw_threshold},
            {"pitch_threshold", pose.pitch_threshold},
            {"minor_yaw_threshold", pose.minor_yaw_threshold},
            {"minor_pitch_threshold", pose.minor_pitch_threshold},
            {"decay_factor", pose.decay_factor},
            {"smoothing_window", pose.smoothing_window}
        }},
        {"objects", {
            {"forbidden_confidence", objects.forbidden_confidence},
            {"person_confidence", objects.person_confidence},
            {"person_class_id", objects.person_class_id},
            {"person_class_name", objects.person_class_name},
            {"forbidden_names", objects.forbidden_names},
            {"forbidden_ids", forbidden_ids}
        }},
        {"detection", {
            {"timeout_ms", detection.timeout_ms},
            {"worker_threads", detection.worker_threads}
        }},
        {"behavior", {
            {"window_size", window_size},
            {"frequent_deviation_ratio", patterns.frequent_deviation_ratio},
            {"repeated_object_ratio", patterns.repeated_object_ratio},
            {"multiple_person_average", patterns.multiple_person_average}
        }},
        {"scoring", {
            {"gaze_weight", scoring.gaze_weight},
            {"forbidden_item_weight", scoring.forbidden_item_weight},
            {"multiple_person_weight", scoring.multiple_person_weight},
            {"repeated_deviation_weight", scoring.repeated_deviation_weight},
            {"repeated_object_weight", scoring.repeated_object_weight},
            {"sustained_gaze_seconds", scoring.sustained_gaze_seconds},
            {"sustained_gaze_weight", scoring.sustained_gaze_weight},
            {"max_score", scoring.max_score},
            {"alert_thresholds", {
                {"low", scoring.low_max},
                {"medium", scoring.medium_max},
                {"high", scoring.high_max}
            }}
        }}
    };
}

bool PipelineConfig::validate(std::string* error) const {
    // Sampling
    if (sampling.motion_threshold < 0.0) return fail(error, "motion_threshold must be >= 0");
    if (sampling.min_fps <= 0.0) return fail(error, "min_fps must be > 0");
    if (sampling.max_fps <= 0.0) return fail(error, "max_fps must be > 0");
    if (sampling.min_fps > sampling.max_fps) return fail(error, "min_fps must not exceed max_fps");
    if (sampling.blur_kernel < 1) return fail(error, "blur_kernel must be >= 1");

    // Preprocessing
    if (preprocessing.clahe_clip_limit <= 0.0) return fail(error, "clahe_clip_limit must be > 0");
    if (preprocessing.clahe_tile_grid < 1) return fail(error, "clahe_tile_grid must be >= 1");
    if (preprocessing.bilateral_diameter < 1) return fail(error, "bilateral_diameter must be >= 1");
    if (preprocessing.gamma <= 0.0) return fail(error, "gamma must be > 0");
    if (preprocessing.roi_ratio <= 0.0 || preprocessing.roi_ratio > 1.0) {
        return fail(error, "roi_ratio must be in (0, 1]");
    }

    // Pose
    if (pose.yaw_threshold <= 0.0 || pose.pitch_threshold <= 0.0) {
        return fail(error, "pose thresholds must be > 0");
    }
    if (pose.decay_factor <= 0.0 || pose.decay_factor >= 1.0) {
        return fail(error, "decay_factor must be in (0, 1)");
    }
    if (pose.smoothing_window < 1) return fail(error, "smoothing_window must be >= 1");

    // Objects
    if (objects.forbidden_confidence < 0.0f || objects.forbidden_confidence > 1.0f ||
        objects.person_confidence < 0.0f || objects.person_confidence > 1.0f) {
        return fail(error, "confidence thresholds must be in [0, 1]");
    }

    // Detection
    if (detection.timeout_ms <= 0) return fail(error, "timeout_ms must be > 0");
    // One thread per branch keeps pose and objects concurrent
    if (detection.worker_threads < 2) return fail(error, "worker_threads must be >= 2");

    // Behavior
    if (window_size < 1) return fail(error, "window_size must be >= 1");
    if (session_queue_size < 1) return fail(error, "session_queue_size must be >= 1");
    if (stats_interval_ms < 0) return fail(error, "stats_interval_ms must be >= 0");

    // Scoring
    if (scoring.gaze_weight < 0 || scoring.forbidden_item_weight < 0 ||
        scoring.multiple_person_weight < 0 || scoring.repeated_deviation_weight < 0 ||
        scoring.repeated_object_weight < 0 || scoring.sustained_gaze_weight < 0) {
        return fail(error, "scoring weights must be >= 0");
    }
    if (scoring.sustained_gaze_seconds < 0.0) return fail(error, "sustained_gaze_seconds must be >= 0");
    if (!(0 < scoring.low_max && scoring.low_max < scoring.medium_max &&
          scoring.medium_max < scoring.high_max)) {
        return fail(error, "alert thresholds must satisfy 0 < low < medium < high");
    }
    if (scoring.max_score < 0) return fail(error, "max_score must be >= 0");

    return true;
}

bool PipelineConfig::load_from_file(const std::string& path, PipelineConfig& out, std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return fail(error, "cannot open config file: " + path);
    }

    PipelineConfig loaded;
    try {
        json j;
        file >> j;
        loaded = from_json(j);
    } catch (const json::exception& e) {
        return fail(error, std::string("invalid config JSON: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return fail(error, std::string("invalid config: ") + e.what());
    } catch (const std::out_of_range& e) {
        return fail(error, std::string("invalid config: ") + e.what());
    }

    std::string reason;
    if (!loaded.validate(&reason)) {
        return fail(error, reason);
    }

    out = loaded;
    return true;
}

} // namespace proctor
