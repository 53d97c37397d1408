#include "PipelineResult.hpp"

namespace proctor {

namespace {

nlohmann::json rect_to_json(const cv::Rect2f& r) {
    return {r.x, r.y, r.width, r.height};
}

nlohmann::json branch_to_json(const BranchReport& report) {
    nlohmann::json j = {
        {"status", branch_status_to_string(report.status)},
        {"elapsed_ms", report.elapsed_ms}
    };
    if (!report.error.empty()) {
        j["error"] = report.error;
    }
    return j;
}

} // namespace

nlohmann::json to_json(const PoseEstimate& pose) {
    return {
        {"yaw", pose.yaw},
        {"pitch", pose.pitch},
        {"roll", pose.roll},
        {"landmarks_count", pose.landmarks_count},
        {"confidence", pose.confidence},
        {"face_detected", pose.face_detected}
    };
}

nlohmann::json to_json(const DeviationReport& deviation) {
    return {
        {"deviation", deviation.deviating},
        {"minor_deviation", deviation.minor_deviation},
        {"deviation_duration", deviation.duration_accumulated},
        {"phase", deviation_phase_to_string(deviation.phase)},
        {"smoothed_yaw", deviation.smoothed_yaw},
        {"smoothed_pitch", deviation.smoothed_pitch}
    };
}

nlohmann::json to_json(const ObjectSignal& objects) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : objects.forbidden_items) {
        items.push_back({
            {"label", item.label},
            {"confidence", item.confidence},
            {"bbox", rect_to_json(item.bbox)}
        });
    }

    nlohmann::json detections = nlohmann::json::array();
    for (const auto& d : objects.all_detections) {
        detections.push_back({
            {"class_id", d.class_id},
            {"class_name", d.class_name},
            {"confidence", d.confidence},
            {"bbox", rect_to_json(d.bbox)}
        });
    }

    return {
        {"person_count", objects.person_count},
        {"forbidden_items", items},
        {"all_detections", detections},
        {"mean_confidence", objects.mean_confidence}
    };
}

nlohmann::json to_json(const BehaviorSnapshot& behavior) {
    nlohmann::json flags = nlohmann::json::array();
    for (PatternFlag flag : behavior.flags) {
        flags.push_back(pattern_flag_to_string(flag));
    }

    return {
        {"repeated_deviations", behavior.repeated_deviations},
        {"repeated_objects", behavior.repeated_objects},
        {"avg_person_count", behavior.avg_person_count},
        {"pattern_score", behavior.pattern_score},
        {"window_frames", behavior.window_frames},
        {"window_size", behavior.window_size},
        {"flags", flags},
        {"analysis_summary", behavior.analysis_summary}
    };
}

nlohmann::json to_json(const RiskAssessment& risk) {
    return {
        {"risk_score", risk.risk_score},
        {"alert_level", alert_level_to_string(risk.alert_level)},
        {"violations", risk.violations},
        {"recommendations", risk.recommendations},
        {"details", risk.details}
    };
}

nlohmann::json to_json(const ProcessingMetadata& metadata) {
    return {
        {"session_id", metadata.session_id},
        {"capture_timestamp", metadata.capture_timestamp},
        {"frame_index", metadata.frame_index},
        {"processed_index", metadata.processed_index},
        {"frame_skipped", metadata.frame_skipped},
        {"motion_score", metadata.motion_score},
        {"sampling_reason", sampling_reason_to_string(metadata.sampling_reason)},
        {"timings_ms", {
            {"sampling", metadata.timings.sampling_ms},
            {"preprocess", metadata.timings.preprocess_ms},
            {"pose", metadata.timings.pose_ms},
            {"object", metadata.timings.object_ms},
            {"detection", metadata.timings.detection_ms},
            {"behavior", metadata.timings.behavior_ms},
            {"scoring", metadata.timings.scoring_ms},
            {"total", metadata.timings.total_ms}
        }},
        {"pose_branch", branch_to_json(metadata.pose_branch)},
        {"object_branch", branch_to_json(metadata.object_branch)},
        {"degraded", metadata.degraded()},
        {"roi_applied", metadata.roi_applied},
        {"preprocessing_stages", metadata.preprocessing_stages}
    };
}

nlohmann::json to_json(const SessionStatistics& stats) {
    return {
        {"total_frames", stats.total_frames},
        {"deviation_frames", stats.deviation_frames},
        {"object_frames", stats.object_frames},
        {"multi_person_frames", stats.multi_person_frames},
        {"forbidden_items", stats.forbidden_items},
        {"max_person_count", stats.max_person_count},
        {"deviation_rate", stats.deviation_rate},
        {"object_rate", stats.object_rate},
        {"duration_seconds", stats.duration_seconds}
    };
}

nlohmann::json PipelineResult::to_json() const {
    return {
        {"pose", proctor::to_json(pose)},
        {"gaze", proctor::to_json(deviation)},
        {"objects", proctor::to_json(objects)},
        {"behavior", proctor::to_json(behavior)},
        {"risk", proctor::to_json(risk)},
        {"metadata", proctor::to_json(metadata)}
    };
}

} // namespace proctor
