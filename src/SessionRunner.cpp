#include "SessionRunner.hpp"
#include <chrono>
#include <iostream>

namespace proctor {

SessionRunner::SessionRunner(const std::string& session_id,
                             ProctorPipeline* pipeline,
                             size_t queue_size,
                             ConsumerMode mode)
    : session_id_(session_id),
      pipeline_(pipeline),
      mode_(mode),
      queue_(queue_size,
             mode == ConsumerMode::REALTIME ? AsyncQueue<QueuedFrame>::OverflowPolicy::DROP_OLDEST
                                            : AsyncQueue<QueuedFrame>::OverflowPolicy::REJECT_NEW) {
}

SessionRunner::~SessionRunner() {
    stop();
}

bool SessionRunner::start() {
    if (running_.load()) {
        report_error("Runner already running");
        return false;
    }

    if (!pipeline_) {
        report_error("No pipeline attached");
        return false;
    }

    running_.store(true);
    thread_ = std::make_unique<std::thread>(&SessionRunner::runner_loop, this);

    std::cout << "[SessionRunner " << session_id_ << "] Started ("
              << (mode_ == ConsumerMode::REALTIME ? "realtime" : "sequential") << ")" << std::endl;

    return true;
}

void SessionRunner::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    queue_.stop();

    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
    queue_.clear();

    std::cout << "[SessionRunner " << session_id_ << "] Stopped. "
              << "Processed: " << frames_processed_.load()
              << ", Dropped: " << queue_.dropped_count()
              << ", Failed: " << frames_failed_.load() << std::endl;
}

bool SessionRunner::submit(const cv::Mat& frame, double capture_timestamp) {
    if (!running_.load()) {
        return false;
    }

    QueuedFrame item;
    item.pixels = frame;
    item.capture_timestamp = capture_timestamp;

    if (!queue_.push(std::move(item))) {
        return false;
    }
    frames_accepted_.fetch_add(1);
    return true;
}

void SessionRunner::wait_idle() {
    while (running_.load()) {
        uint64_t evicted = mode_ == ConsumerMode::REALTIME ? queue_.dropped_count() : 0;
        if (frames_completed_.load() + evicted >= frames_accepted_.load()) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

bool SessionRunner::is_running() const {
    return running_.load();
}

const std::string& SessionRunner::get_session_id() const {
    return session_id_;
}

ConsumerMode SessionRunner::get_mode() const {
    return mode_;
}

uint64_t SessionRunner::get_frames_processed() const {
    return frames_processed_.load();
}

uint64_t SessionRunner::get_frames_dropped() const {
    return queue_.dropped_count();
}

uint64_t SessionRunner::get_frames_failed() const {
    return frames_failed_.load();
}

void SessionRunner::set_result_callback(ResultCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    result_callback_ = callback;
}

void SessionRunner::set_error_callback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    error_callback_ = callback;
}

void SessionRunner::runner_loop() {
    while (running_.load()) {
        auto item = queue_.pop(50);
        if (!item) {
            continue;
        }

        // Frames of one session are processed strictly in order (BLOCKING)
        process_frame(*item);
        frames_completed_.fetch_add(1);
    }
}

void SessionRunner::process_frame(const QueuedFrame& frame) {
    try {
        PipelineResult result = pipeline_->process(session_id_, frame.pixels, frame.capture_timestamp);
        frames_processed_.fetch_add(1);

        ResultCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = result_callback_;
        }
        if (callback) {
            callback(result);
        }

    } catch (const FrameRejected& e) {
        if (e.reason() == RejectReason::SESSION_ENDED) {
            // Cancelled frame: nothing is delivered
            return;
        }
        frames_failed_.fetch_add(1);
        report_error(e.what());
    } catch (const std::exception& e) {
        frames_failed_.fetch_add(1);
        report_error(std::string("Frame processing failed: ") + e.what());
    }
}

void SessionRunner::report_error(const std::string& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = error_callback_;
    }
    std::cerr << "[SessionRunner " << session_id_ << " Error] " << error << std::endl;
    if (callback) {
        callback(session_id_, error);
    }
}

// SessionSupervisor implementation

SessionSupervisor::SessionSupervisor(ProctorPipeline* pipeline, size_t queue_size, ConsumerMode mode)
    : pipeline_(pipeline), queue_size_(queue_size), mode_(mode) {
}

SessionSupervisor::~SessionSupervisor() {
    stop_all();
}

bool SessionSupervisor::start_session(const std::string& session_id,
                                      SessionRunner::ResultCallback on_result,
                                      SessionRunner::ErrorCallback on_error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (runners_.count(session_id) > 0) {
        std::cerr << "[SessionSupervisor] Session " << session_id << " already has a runner" << std::endl;
        return false;
    }

    if (!pipeline_->start_session(session_id)) {
        return false;
    }

    auto runner = std::make_unique<SessionRunner>(session_id, pipeline_, queue_size_, mode_);
    runner->set_result_callback(std::move(on_result));
    if (on_error) {
        runner->set_error_callback(std::move(on_error));
    }

    if (!runner->start()) {
        pipeline_->end_session(session_id);
        return false;
    }

    runners_[session_id] = std::move(runner);
    return true;
}

bool SessionSupervisor::submit(const std::string& session_id, const cv::Mat& frame, double capture_timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runners_.find(session_id);
    if (it == runners_.end()) {
        return false;
    }
    return it->second->submit(frame, capture_timestamp);
}

bool SessionSupervisor::end_session(const std::string& session_id) {
    std::unique_ptr<SessionRunner> runner;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runners_.find(session_id);
        if (it == runners_.end()) {
            return false;
        }
        runner = std::move(it->second);
        runners_.erase(it);
    }

    // Cancel first so the runner is not left waiting on detectors
    pipeline_->end_session(session_id);
    runner->stop();
    return true;
}

void SessionSupervisor::stop_all() {
    std::map<std::string, std::unique_ptr<SessionRunner>> runners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        runners.swap(runners_);
    }

    for (auto& entry : runners) {
        pipeline_->end_session(entry.first);
        entry.second->stop();
    }

    if (!runners.empty()) {
        std::cout << "[SessionSupervisor] Stopped " << runners.size() << " session runners" << std::endl;
    }
}

SessionRunner* SessionSupervisor::get_runner(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runners_.find(session_id);
    return it == runners_.end() ? nullptr : it->second.get();
}

size_t SessionSupervisor::active_runners() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runners_.size();
}

} // namespace proctor
