#include "ProctorPipeline.hpp"
#include "ReplayProvider.hpp"
#include "SessionRunner.hpp"

#include <opencv2/imgproc.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>

using namespace proctor;

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    std::cout << "\nReceived signal " << signum << ", shutting down..." << std::endl;
    g_running.store(false);
}

// Candidate in "exam-look-away" turns to the side after two seconds.
// Everyone else faces the screen with a little jitter.
class DemoLandmarkProvider : public LandmarkProvider {
public:
    std::optional<FaceLandmarks> detect(const cv::Mat& image,
                                        const FrameContext& context,
                                        const CancellationToken& token) override {
        // Simulated model latency
        if (!cooperative_sleep(15, token)) {
            return std::nullopt;
        }

        EulerAngles pose;
        pose.yaw = 3.0 * std::sin(context.capture_timestamp);
        pose.pitch = 2.0 * std::cos(context.capture_timestamp);

        if (context.session_id == "exam-look-away" && context.capture_timestamp > 2.0) {
            pose.yaw = 55.0;
        }
        return synthesize_landmarks(pose, image.size());
    }

    std::string name() const override { return "demo-landmarks"; }
};

// "exam-phone" shows a phone on the desk; "exam-helper" has a second person
// walk in for a while.
class DemoObjectDetector : public ObjectDetector {
public:
    std::vector<RawDetection> detect(const cv::Mat& image,
                                     const FrameContext& context,
                                     const CancellationToken& token) override {
        if (!cooperative_sleep(25, token)) {
            return {};
        }

        float w = static_cast<float>(image.cols);
        float h = static_cast<float>(image.rows);

        std::vector<RawDetection> detections;
        detections.push_back({0, "person", 0.93f, cv::Rect2f(w * 0.3f, h * 0.1f, w * 0.4f, h * 0.8f)});

        if (context.session_id == "exam-phone" && context.capture_timestamp > 1.0) {
            detections.push_back({67, "cell phone", 0.81f, cv::Rect2f(w * 0.75f, h * 0.7f, 60, 110)});
        }
        if (context.session_id == "exam-helper" &&
            context.capture_timestamp > 1.5 && context.capture_timestamp < 4.0) {
            detections.push_back({0, "person", 0.77f, cv::Rect2f(w * 0.02f, h * 0.2f, w * 0.25f, h * 0.75f)});
        }
        return detections;
    }

    std::string name() const override { return "demo-objects"; }
};

int main() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "=== Proctoring Pipeline Example ===" << std::endl;
    std::cout << "This example demonstrates:" << std::endl;
    std::cout << "  - Four exam sessions sharing one pipeline, each with its own branch threads" << std::endl;
    std::cout << "  - One runner per session (frames of a session stay in order)" << std::endl;
    std::cout << "  - Risk alerts for gaze deviation, a phone and a second person" << std::endl;
    std::cout << "\nPress Ctrl+C to stop\n" << std::endl;

    PipelineConfig config;
    config.detection.worker_threads = 2;
    config.detection.timeout_ms = 200;
    config.sampling.max_fps = 10.0;
    config.sampling.min_fps = 5.0;
    config.stats_interval_ms = 2000;

    ProctorPipeline pipeline(config,
                             std::make_shared<DemoLandmarkProvider>(),
                             std::make_shared<DemoObjectDetector>());

    SessionSupervisor supervisor(&pipeline, config.session_queue_size, ConsumerMode::REALTIME);

    std::mutex print_mutex;
    std::map<std::string, AlertLevel> last_level;

    auto on_result = [&](const PipelineResult& result) {
        if (result.metadata.frame_skipped) {
            return;
        }
        std::lock_guard<std::mutex> lock(print_mutex);
        AlertLevel& previous = last_level[result.metadata.session_id];
        if (result.risk.alert_level == previous) {
            return;
        }
        previous = result.risk.alert_level;

        std::cout << "[" << result.metadata.session_id << "] t="
                  << std::fixed << std::setprecision(1) << result.metadata.capture_timestamp
                  << "s risk " << result.risk.risk_score
                  << " -> " << alert_level_to_string(result.risk.alert_level) << std::endl;
        for (const auto& violation : result.risk.violations) {
            std::cout << "    " << violation << std::endl;
        }
    };

    const std::vector<std::string> sessions = {"exam-clean", "exam-look-away", "exam-phone", "exam-helper"};
    for (const auto& id : sessions) {
        if (!supervisor.start_session(id, on_result)) {
            std::cerr << "Failed to start session " << id << std::endl;
            return 1;
        }
    }

    // 6 seconds of 30 fps video per session, paced in real time
    const double fps = 30.0;
    const int total_frames = 180;
    auto start = std::chrono::steady_clock::now();

    for (int i = 0; i < total_frames && g_running.load(); ++i) {
        double timestamp = i / fps;
        for (size_t s = 0; s < sessions.size(); ++s) {
            cv::Mat frame(360, 480, CV_8UC3, cv::Scalar(70 + 20 * static_cast<int>(s), 80, 90));
            // Slow drift so the sampler sees some motion
            int x = (i * 3 + static_cast<int>(s) * 40) % 400;
            cv::circle(frame, cv::Point(x + 40, 180), 35, cv::Scalar(200, 180, 160), cv::FILLED);
            supervisor.submit(sessions[s], frame, timestamp);
        }
        std::this_thread::sleep_until(start + std::chrono::microseconds(static_cast<int64_t>((i + 1) * 1e6 / fps)));
    }

    for (const auto& id : sessions) {
        if (auto* runner = supervisor.get_runner(id)) {
            runner->wait_idle();
        }
    }

    std::cout << "\n=== Session Summaries ===" << std::endl;
    for (const auto& id : sessions) {
        auto summary = pipeline.session_statistics(id);
        if (!summary) continue;
        std::cout << "\n" << id << ":" << std::endl;
        std::cout << "  Submitted: " << summary->frames_submitted
                  << "  Processed: " << summary->frames_processed
                  << "  Skip ratio: " << std::setprecision(2) << summary->skip_ratio << std::endl;
        std::cout << "  Deviation time: " << std::setprecision(1) << summary->deviation_duration << "s" << std::endl;
        std::cout << "  Deviation rate: " << std::setprecision(2) << summary->behavior.deviation_rate
                  << "  Object rate: " << summary->behavior.object_rate
                  << "  Max persons: " << summary->behavior.max_person_count << std::endl;
        if (summary->last_assessment) {
            std::cout << "  Final alert: " << alert_level_to_string(summary->last_assessment->alert_level)
                      << std::endl;
        }
    }

    std::cout << "\nStopping system..." << std::endl;
    supervisor.stop_all();
    StatsService::print_summary(pipeline.stats().get_summary());
    std::cout << "System stopped successfully" << std::endl;

    return 0;
}
