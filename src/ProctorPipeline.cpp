#include "ProctorPipeline.hpp"
#include "Utils.hpp"

#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace proctor {

nlohmann::json SessionSummary::to_json() const {
    nlohmann::json j = {
        {"session_id", session_id},
        {"frames_submitted", frames_submitted},
        {"frames_processed", frames_processed},
        {"frames_skipped", frames_skipped},
        {"frames_degraded", frames_degraded},
        {"skip_ratio", skip_ratio},
        {"deviation_duration", deviation_duration},
        {"session_seconds", session_seconds},
        {"behavior", proctor::to_json(behavior)}
    };
    if (last_assessment) {
        j["last_assessment"] = proctor::to_json(*last_assessment);
    } else {
        j["last_assessment"] = nullptr;
    }
    return j;
}

ProctorPipeline::ProctorPipeline(const PipelineConfig& config,
                                 std::shared_ptr<LandmarkProvider> landmark_provider,
                                 std::shared_ptr<ObjectDetector> object_detector)
    : config_(config),
      preprocessor_(config.preprocessing),
      pose_estimator_(config.pose),
      scorer_(config.scoring),
      registry_(config.max_sessions) {
    std::string error;
    if (!config_.validate(&error)) {
        throw std::invalid_argument("invalid pipeline config: " + error);
    }

    coordinator_ = std::make_unique<DetectionCoordinator>(std::move(landmark_provider),
                                                          std::move(object_detector),
                                                          config_.verbose_logging);

    if (!coordinator_->has_landmark_provider()) {
        std::cerr << "[ProctorPipeline] No landmark provider: pose branch disabled" << std::endl;
    }
    if (!coordinator_->has_object_detector()) {
        std::cerr << "[ProctorPipeline] No object detector: object branch disabled" << std::endl;
    }

    if (config_.stats_interval_ms > 0) {
        stats_.start(config_.stats_interval_ms);
    }

    std::cout << "[ProctorPipeline] Ready: " << config_.detection.worker_threads << " branch threads per session, "
              << "timeout " << config_.detection.timeout_ms << "ms, "
              << "window " << config_.window_size << ", "
              << "landmarks=" << coordinator_->landmark_provider_name() << ", "
              << "objects=" << coordinator_->object_detector_name() << std::endl;
}

ProctorPipeline::~ProctorPipeline() {
    end_all_sessions();
    stats_.stop();
    // Session executors join abandoned branches as the last references drop
}

bool ProctorPipeline::start_session(const std::string& session_id, std::string* error) {
    auto status = registry_.create(session_id, config_.detection.worker_threads);
    if (status != SessionRegistry::CreateStatus::CREATED) {
        std::string reason = SessionRegistry::create_status_to_string(status);
        if (error) *error = reason;
        std::cerr << "[ProctorPipeline] Cannot start session '" << session_id << "': "
                  << reason << std::endl;
        return false;
    }

    stats_.record_session_started();
    std::cout << "[ProctorPipeline] Session " << session_id << " started ("
              << registry_.size() << " active)" << std::endl;
    return true;
}

bool ProctorPipeline::end_session(const std::string& session_id) {
    auto removed = registry_.remove(session_id);
    if (!removed) {
        return false;
    }

    stats_.record_session_ended();
    std::cout << "[ProctorPipeline] Session " << session_id << " ended ("
              << registry_.size() << " active)" << std::endl;
    return true;
}

void ProctorPipeline::end_all_sessions() {
    for (const auto& id : registry_.session_ids()) {
        end_session(id);
    }
}

bool ProctorPipeline::has_session(const std::string& session_id) const {
    return registry_.contains(session_id);
}

size_t ProctorPipeline::active_sessions() const {
    return registry_.size();
}

PipelineResult ProctorPipeline::process(const std::string& session_id, const cv::Mat& frame,
                                        double capture_timestamp) {
    return process(Frame(session_id, frame, capture_timestamp));
}

std::shared_ptr<SessionState> ProctorPipeline::lookup_for(const Frame& frame) {
    // Validation and lookup happen before any session state is touched
    try {
        frame.validate();
    } catch (const FrameRejected&) {
        stats_.record_rejected();
        throw;
    }

    auto session = registry_.find(frame.session_id);
    if (!session) {
        stats_.record_rejected();
        throw FrameRejected(RejectReason::UNKNOWN_SESSION, "session '" + frame.session_id + "'");
    }
    return session;
}

PipelineResult ProctorPipeline::process(const Frame& frame) {
    auto session = lookup_for(frame);
    return run_frame(*session, frame, config_);
}

PipelineResult ProctorPipeline::process(const std::string& session_id, const cv::Mat& frame,
                                        double capture_timestamp, const PipelineConfig& config) {
    std::string error;
    if (!config.validate(&error)) {
        throw std::invalid_argument("invalid per-call config: " + error);
    }

    Frame input(session_id, frame, capture_timestamp);
    auto session = lookup_for(input);
    return run_frame(*session, input, config);
}

PipelineResult ProctorPipeline::run_frame(SessionState& session, const Frame& frame,
                                          const PipelineConfig& config) {
    std::lock_guard<std::mutex> lock(session.mutex);

    if (session.is_ended()) {
        stats_.record_rejected();
        throw FrameRejected(RejectReason::SESSION_ENDED, "session '" + session.session_id + "'");
    }

    auto frame_start = std::chrono::steady_clock::now();
    stats_.record_submitted();
    session.frames_submitted++;

    // ---- Admission ----
    // Decided on a copy; an admitted frame commits it only once fully scored
    auto stage_start = std::chrono::steady_clock::now();
    SamplerState sampler = session.sampler;
    SamplingDecision decision = AdaptiveFrameSampler::decide(frame.pixels, frame.capture_timestamp,
                                                             sampler, config.sampling);
    double sampling_ms = utils::elapsed_ms(stage_start);

    if (!decision.admit) {
        session.sampler = std::move(sampler);
        session.frames_skipped++;
        stats_.record_skipped();

        PipelineResult skipped;
        if (session.last_result) {
            skipped = *session.last_result;
        } else {
            skipped.metadata.session_id = session.session_id;
            skipped.metadata.capture_timestamp = frame.capture_timestamp;
            skipped.metadata.frame_index = session.frames_submitted;
            skipped.metadata.sampling_reason = decision.reason;
            skipped.metadata.pose_branch.status = BranchStatus::NOT_RUN;
            skipped.metadata.object_branch.status = BranchStatus::NOT_RUN;
        }
        skipped.metadata.frame_skipped = true;
        skipped.metadata.motion_score = decision.motion_score;
        return skipped;
    }

    PipelineResult result;
    ProcessingMetadata& meta = result.metadata;
    meta.session_id = session.session_id;
    meta.capture_timestamp = frame.capture_timestamp;
    meta.frame_index = session.frames_submitted;
    meta.processed_index = session.frames_processed + 1;
    meta.motion_score = decision.motion_score;
    meta.sampling_reason = decision.reason;
    meta.timings.sampling_ms = sampling_ms;

    // ---- Preprocess ----
    stage_start = std::chrono::steady_clock::now();
    PreprocessedFrame processed = preprocessor_.apply(frame.pixels, config.preprocessing);
    meta.timings.preprocess_ms = utils::elapsed_ms(stage_start);
    meta.roi_applied = processed.roi.enabled;
    meta.preprocessing_stages = processed.stages_applied;

    // ---- Fan-out / fan-in ----
    FrameContext context;
    context.session_id = session.session_id;
    context.frame_index = meta.frame_index;
    context.capture_timestamp = frame.capture_timestamp;

    stage_start = std::chrono::steady_clock::now();
    DetectionOutcome outcome = coordinator_->run(session.executor, processed, context,
                                                 config.detection.timeout_ms, config.objects,
                                                 session.cancelled);
    meta.timings.detection_ms = utils::elapsed_ms(stage_start);

    if (outcome.cancelled || session.is_ended()) {
        stats_.record_cancelled();
        if (config.verbose_logging) {
            std::cout << "[ProctorPipeline] Session " << session.session_id << " frame "
                      << meta.frame_index << " dropped: session ended" << std::endl;
        }
        throw FrameRejected(RejectReason::SESSION_ENDED,
                            "session '" + session.session_id + "' ended during processing");
    }

    result.pose = outcome.pose;
    result.objects = outcome.objects;
    meta.pose_branch = outcome.pose_branch;
    meta.object_branch = outcome.object_branch;
    meta.timings.pose_ms = outcome.pose_branch.elapsed_ms;
    meta.timings.object_ms = outcome.object_branch.elapsed_ms;

    for (const BranchReport* branch : {&outcome.pose_branch, &outcome.object_branch}) {
        if (branch->status == BranchStatus::TIMEOUT) stats_.record_branch_timeout();
        if (branch->status == BranchStatus::FAILED) stats_.record_branch_failure();
    }

    // ---- Deviation state (session thread only) ----
    result.deviation = pose_estimator_.advance(result.pose, frame.capture_timestamp,
                                               session.deviation, config.pose);

    // ---- Behavior window ----
    stage_start = std::chrono::steady_clock::now();
    BehaviorRecord record;
    record.timestamp = frame.capture_timestamp;
    record.gaze_deviation = result.deviation.deviating;
    record.person_count = result.objects.person_count;
    for (const auto& item : result.objects.forbidden_items) {
        record.forbidden_items.push_back(item.label);
    }
    result.behavior = BehaviorWindow::update(session.window, record, config.window_size, config.patterns);
    meta.timings.behavior_ms = utils::elapsed_ms(stage_start);

    // ---- Scoring ----
    stage_start = std::chrono::steady_clock::now();
    result.risk = scorer_.score(result.deviation, result.objects, result.behavior, config.scoring);
    meta.timings.scoring_ms = utils::elapsed_ms(stage_start);

    meta.timings.total_ms = utils::elapsed_ms(frame_start);

    session.sampler = std::move(sampler);
    session.frames_processed++;
    if (meta.degraded()) session.frames_degraded++;
    session.last_result = result;

    bool high_alert = result.risk.alert_level == AlertLevel::HIGH ||
                      result.risk.alert_level == AlertLevel::CRITICAL;
    stats_.record_processed(meta.timings.total_ms, meta.degraded(), high_alert);

    if (config.verbose_logging) {
        std::cout << "[ProctorPipeline] Session " << session.session_id
                  << " frame " << meta.frame_index
                  << " | " << sampling_reason_to_string(meta.sampling_reason)
                  << " | yaw " << std::fixed << std::setprecision(1) << result.pose.yaw
                  << " pitch " << result.pose.pitch
                  << " | persons " << result.objects.person_count
                  << " items " << result.objects.forbidden_items.size()
                  << " | risk " << result.risk.risk_score
                  << " (" << alert_level_to_string(result.risk.alert_level) << ")"
                  << " | " << std::setprecision(1) << meta.timings.total_ms << "ms"
                  << std::endl;
    }

    return result;
}

std::optional<SessionSummary> ProctorPipeline::session_statistics(const std::string& session_id) const {
    auto session = registry_.find(session_id);
    if (!session) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(session->mutex);

    SessionSummary summary;
    summary.session_id = session->session_id;
    summary.frames_submitted = session->frames_submitted;
    summary.frames_processed = session->frames_processed;
    summary.frames_skipped = session->frames_skipped;
    summary.frames_degraded = session->frames_degraded;
    summary.skip_ratio = session->sampler.skip_ratio();
    summary.deviation_duration = session->deviation.duration_accumulated;
    summary.session_seconds = utils::elapsed_ms(session->started_at) / 1000.0;
    summary.behavior = BehaviorWindow::statistics(session->window);
    if (session->last_result) {
        summary.last_assessment = session->last_result->risk;
    }
    return summary;
}

nlohmann::json ProctorPipeline::pipeline_info() const {
    auto s = stats_.get_summary();
    return {
        {"active_sessions", registry_.size()},
        {"max_sessions", config_.max_sessions},
        {"sessions", registry_.session_ids()},
        {"worker_threads", config_.detection.worker_threads},
        {"landmark_provider", coordinator_->landmark_provider_name()},
        {"object_detector", coordinator_->object_detector_name()},
        {"stats", {
            {"frames_submitted", s.frames_submitted},
            {"frames_processed", s.frames_processed},
            {"frames_skipped", s.frames_skipped},
            {"frames_rejected", s.frames_rejected},
            {"frames_cancelled", s.frames_cancelled},
            {"degraded_frames", s.degraded_frames},
            {"branch_timeouts", s.branch_timeouts},
            {"branch_failures", s.branch_failures},
            {"avg_processing_ms", s.avg_processing_ms},
            {"skip_ratio", s.skip_ratio}
        }},
        {"config", config_.to_json()}
    };
}

} // namespace proctor
