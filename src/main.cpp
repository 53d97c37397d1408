#include "PipelineConfig.hpp"
#include "ProctorPipeline.hpp"
#include "ReplayProvider.hpp"
#include "SessionRunner.hpp"
#include "Utils.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>

namespace {

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signum) {
    if (shutdown_requested.exchange(true)) {
        // Second signal: stop waiting for the replay to drain
        _exit(signum);
    }
}

struct Options {
    std::string video_path;           // Empty with --synthetic
    std::string script_path;
    std::string config_path;
    std::string session_id = "replay";
    std::string save_dir;
    int synthetic_frames = 0;
    double fps = 0.0;                 // 0 = take it from the container
    bool verbose = false;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <video|--synthetic N> <script.json> [options]\n"
              << "  --config <path>     Pipeline config (default: $PROCTOR_CONFIG)\n"
              << "  --session <id>      Session id (default: replay)\n"
              << "  --fps <n>           Override frame rate used for timestamps\n"
              << "  --save-dir <dir>    Save annotated frames with a HIGH or CRITICAL alert\n"
              << "  --verbose           Per-frame pipeline logs\n";
}

bool parse_options(int argc, char* argv[], Options& opts) {
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        try {
            if (arg == "--config") {
                if (!next(opts.config_path)) return false;
            } else if (arg == "--session") {
                if (!next(opts.session_id)) return false;
            } else if (arg == "--save-dir") {
                if (!next(opts.save_dir)) return false;
            } else if (arg == "--fps") {
                if (!next(value)) return false;
                opts.fps = std::stod(value);
            } else if (arg == "--synthetic") {
                if (!next(value)) return false;
                opts.synthetic_frames = std::stoi(value);
                positional++;
            } else if (arg == "--verbose") {
                opts.verbose = true;
            } else if (arg == "-h" || arg == "--help") {
                return false;
            } else if (positional == 0) {
                opts.video_path = arg;
                positional++;
            } else if (positional == 1) {
                opts.script_path = arg;
                positional++;
            } else {
                std::cerr << "Unexpected argument: " << arg << std::endl;
                return false;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << arg << ": " << e.what() << std::endl;
            return false;
        }
    }

    if (opts.config_path.empty()) {
        const char* env = std::getenv("PROCTOR_CONFIG");
        if (env) opts.config_path = env;
    }

    return positional == 2;
}

/**
 * @brief Frame source: a video file or a generated scene with a moving block
 */
class FrameSource {
public:
    explicit FrameSource(const Options& opts) : synthetic_total_(opts.synthetic_frames) {
        if (synthetic_total_ > 0) {
            fps_ = opts.fps > 0.0 ? opts.fps : 30.0;
            return;
        }

        capture_.open(opts.video_path);
        double container_fps = capture_.isOpened() ? capture_.get(cv::CAP_PROP_FPS) : 0.0;
        fps_ = opts.fps > 0.0 ? opts.fps : (container_fps > 0.0 ? container_fps : 30.0);
    }

    bool is_open() const { return synthetic_total_ > 0 || capture_.isOpened(); }
    double fps() const { return fps_; }

    bool read(cv::Mat& frame) {
        if (synthetic_total_ > 0) {
            if (synthetic_index_ >= synthetic_total_) return false;
            frame = cv::Mat(480, 640, CV_8UC3, cv::Scalar(90, 90, 90));
            // Block sweeps across the frame every 4 seconds
            int x = static_cast<int>((synthetic_index_ * 640.0 / (fps_ * 4.0))) % 560;
            cv::rectangle(frame, cv::Rect(x, 300, 80, 80), cv::Scalar(20, 200, 240), cv::FILLED);
            synthetic_index_++;
            return true;
        }
        return capture_.read(frame) && !frame.empty();
    }

private:
    cv::VideoCapture capture_;
    int synthetic_total_ = 0;
    int synthetic_index_ = 0;
    double fps_ = 30.0;
};

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_options(argc, argv, opts)) {
        print_usage(argv[0]);
        return 2;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    proctor::PipelineConfig config;
    if (!opts.config_path.empty()) {
        std::string error;
        if (!proctor::PipelineConfig::load_from_file(opts.config_path, config, &error)) {
            std::cerr << "[Replay] " << error << std::endl;
            return 1;
        }
        std::cerr << "[Replay] Config: " << opts.config_path << std::endl;
    }
    if (opts.verbose) {
        config.verbose_logging = true;
    }

    auto script = std::make_shared<proctor::ReplayScript>();
    {
        std::string error;
        if (!proctor::ReplayScript::load_from_file(opts.script_path, *script, &error)) {
            std::cerr << "[Replay] " << error << std::endl;
            return 1;
        }
    }

    FrameSource source(opts);
    if (!source.is_open()) {
        std::cerr << "[Replay] Cannot open video: " << opts.video_path << std::endl;
        return 1;
    }

    bool save_frames = !opts.save_dir.empty();
    if (save_frames && !proctor::utils::ensure_directory_exists(opts.save_dir)) {
        std::cerr << "[Replay] Cannot create " << opts.save_dir << std::endl;
        return 1;
    }

    std::unique_ptr<proctor::ProctorPipeline> pipeline;
    try {
        pipeline = std::make_unique<proctor::ProctorPipeline>(
            config,
            std::make_shared<proctor::ReplayLandmarkProvider>(script),
            std::make_shared<proctor::ReplayObjectDetector>(script));
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Replay] " << e.what() << std::endl;
        return 1;
    }

    // One JSON line per result; replay logs go to stderr
    std::mutex output_mutex;
    std::map<uint64_t, cv::Mat> pending_frames;   // Kept for annotation until their result arrives
    uint64_t saved = 0;

    // Frames of one session go through a sequential runner so the replay is
    // never faster than the pipeline
    proctor::SessionSupervisor supervisor(pipeline.get(), config.session_queue_size,
                                          proctor::ConsumerMode::SEQUENTIAL);

    auto on_result = [&](const proctor::PipelineResult& result) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << result.to_json().dump() << std::endl;

        if (!save_frames) return;
        auto it = pending_frames.find(result.metadata.frame_index);
        bool alert = result.risk.alert_level == proctor::AlertLevel::HIGH ||
                     result.risk.alert_level == proctor::AlertLevel::CRITICAL;
        if (it != pending_frames.end() && alert && !result.metadata.frame_skipped) {
            std::string path = opts.save_dir + "/" + opts.session_id + "_" +
                               proctor::utils::get_timestamp_string() + "_" +
                               std::to_string(result.metadata.frame_index) + ".jpg";
            if (proctor::utils::save_frame_as_jpeg(
                    proctor::utils::create_visualization(it->second, result), path)) {
                saved++;
            }
        }
        pending_frames.erase(pending_frames.begin(), pending_frames.upper_bound(result.metadata.frame_index));
    };
    auto on_error = [&](const std::string& session_id, const std::string& error) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cerr << "[Replay] " << session_id << ": " << error << std::endl;
    };

    if (!supervisor.start_session(opts.session_id, on_result, on_error)) {
        return 1;
    }

    std::cerr << "[Replay] Session " << opts.session_id << ": " << script->size()
              << " script entries, " << source.fps() << " fps" << std::endl;

    cv::Mat frame;
    uint64_t frame_count = 0;
    auto wall_start = std::chrono::steady_clock::now();

    while (!shutdown_requested.load() && source.read(frame)) {
        double timestamp = static_cast<double>(frame_count) / source.fps();
        frame_count++;

        // VideoCapture may reuse its buffer on the next read
        cv::Mat owned = frame.clone();
        if (save_frames) {
            std::lock_guard<std::mutex> lock(output_mutex);
            pending_frames[frame_count] = owned;
        }

        while (!supervisor.submit(opts.session_id, owned, timestamp)) {
            if (shutdown_requested.load()) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    if (auto* runner = supervisor.get_runner(opts.session_id)) {
        if (!shutdown_requested.load()) {
            runner->wait_idle();
        }
    }

    auto summary = pipeline->session_statistics(opts.session_id);
    supervisor.end_session(opts.session_id);

    double wall_s = proctor::utils::elapsed_ms(wall_start) / 1000.0;
    proctor::StatsService::print_summary(pipeline->stats().get_summary());

    if (summary) {
        nlohmann::json footer = {{"summary", summary->to_json()},
                                 {"frames_read", frame_count},
                                 {"frames_saved", saved},
                                 {"wall_seconds", wall_s}};
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << footer.dump() << std::endl;
    }

    return shutdown_requested.load() ? 130 : 0;
}
