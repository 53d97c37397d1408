#pragma once

#include "AsyncQueue.hpp"
#include "ProctorPipeline.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace proctor {

/**
 * @brief How a runner's input queue behaves when the session falls behind
 */
enum class ConsumerMode {
    REALTIME,    // Drop the oldest queued frame, keep the newest
    SEQUENTIAL   // Refuse new frames until the queue has room
};

/**
 * @brief One sequential worker per session
 *
 * The transport thread submits frames; the runner thread feeds them to
 * ProctorPipeline::process in order and hands each result to the result
 * callback. Runners of different sessions run independently.
 */
class SessionRunner {
public:
    using ResultCallback = std::function<void(const PipelineResult&)>;
    using ErrorCallback = std::function<void(const std::string& session_id, const std::string& error)>;

    /**
     * @param session_id Session this runner feeds (must be started on the pipeline)
     * @param pipeline Pipeline to run frames through (not owned, must outlive the runner)
     * @param queue_size Frames buffered ahead of processing
     * @param mode Overflow behavior of the queue
     */
    SessionRunner(const std::string& session_id,
                  ProctorPipeline* pipeline,
                  size_t queue_size = 8,
                  ConsumerMode mode = ConsumerMode::REALTIME);

    ~SessionRunner();

    SessionRunner(const SessionRunner&) = delete;
    SessionRunner& operator=(const SessionRunner&) = delete;

    bool start();

    /**
     * @brief Stop the runner thread; queued frames are discarded
     */
    void stop();

    /**
     * @brief Queue a frame. The buffer is shared, not copied: do not write
     *        to it after submitting.
     * @return false if the runner is stopped or the frame was refused
     */
    bool submit(const cv::Mat& frame, double capture_timestamp);

    /**
     * @brief Block until the queue is empty and the current frame is done
     */
    void wait_idle();

    bool is_running() const;
    const std::string& get_session_id() const;
    ConsumerMode get_mode() const;

    uint64_t get_frames_processed() const;
    uint64_t get_frames_dropped() const;
    uint64_t get_frames_failed() const;

    void set_result_callback(ResultCallback callback);
    void set_error_callback(ErrorCallback callback);

private:
    struct QueuedFrame {
        cv::Mat pixels;
        double capture_timestamp = 0.0;
    };

    std::string session_id_;
    ProctorPipeline* pipeline_;
    ConsumerMode mode_;
    AsyncQueue<QueuedFrame> queue_;

    std::unique_ptr<std::thread> thread_;
    std::atomic<bool> running_{false};

    // Statistics
    std::atomic<uint64_t> frames_processed_{0};
    std::atomic<uint64_t> frames_failed_{0};
    std::atomic<uint64_t> frames_accepted_{0};
    std::atomic<uint64_t> frames_completed_{0};

    ResultCallback result_callback_;
    ErrorCallback error_callback_;
    std::mutex callback_mutex_;

    void runner_loop();
    void process_frame(const QueuedFrame& frame);
    void report_error(const std::string& error);
};

/**
 * @brief Starts and stops runners together with their pipeline sessions
 */
class SessionSupervisor {
public:
    explicit SessionSupervisor(ProctorPipeline* pipeline,
                               size_t queue_size = 8,
                               ConsumerMode mode = ConsumerMode::REALTIME);

    ~SessionSupervisor();

    SessionSupervisor(const SessionSupervisor&) = delete;
    SessionSupervisor& operator=(const SessionSupervisor&) = delete;

    /**
     * @brief Register the session on the pipeline and start its runner
     */
    bool start_session(const std::string& session_id,
                       SessionRunner::ResultCallback on_result,
                       SessionRunner::ErrorCallback on_error = nullptr);

    bool submit(const std::string& session_id, const cv::Mat& frame, double capture_timestamp);

    /**
     * @brief End the session on the pipeline (cancelling its in-flight frame)
     *        and stop its runner
     */
    bool end_session(const std::string& session_id);

    void stop_all();

    /**
     * @brief Get runner by session id
     * @return Pointer to runner, or nullptr if not found
     */
    SessionRunner* get_runner(const std::string& session_id);

    size_t active_runners() const;

private:
    ProctorPipeline* pipeline_;
    size_t queue_size_;
    ConsumerMode mode_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<SessionRunner>> runners_;
};

} // namespace proctor
