#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>

namespace proctor {

/**
 * @brief Pipeline-wide counters with optional periodic logging
 *
 * Shared by all sessions. Counters are lock-free; the timing window takes a
 * short lock.
 */
class StatsService {
public:
    struct Summary {
        uint64_t frames_submitted = 0;
        uint64_t frames_processed = 0;
        uint64_t frames_skipped = 0;
        uint64_t frames_rejected = 0;
        uint64_t frames_cancelled = 0;
        uint64_t degraded_frames = 0;
        uint64_t branch_timeouts = 0;
        uint64_t branch_failures = 0;
        uint64_t alerts_high = 0;         // High or critical
        uint64_t sessions_started = 0;
        uint64_t sessions_ended = 0;
        double avg_processing_ms = 0.0;   // Over the last PROCESSING_WINDOW frames
        double skip_ratio = 0.0;
    };

    StatsService() : running_(false), log_interval_ms_(1000) {}

    ~StatsService() {
        stop();
    }

    StatsService(const StatsService&) = delete;
    StatsService& operator=(const StatsService&) = delete;

    void start(int log_interval_ms = 1000) {
        if (running_) return;
        log_interval_ms_ = log_interval_ms;
        running_ = true;
        logger_thread_ = std::thread(&StatsService::logger_loop, this);
        std::cout << "[StatsService] Started (interval: " << log_interval_ms << "ms)" << std::endl;
    }

    void stop() {
        if (running_.exchange(false)) {
            cv_.notify_all();
            if (logger_thread_.joinable()) {
                logger_thread_.join();
            }
            std::cout << "[StatsService] Stopped" << std::endl;
        }
    }

    bool is_running() const { return running_; }

    // === Recording (hot path) ===

    void record_submitted() { frames_submitted_.fetch_add(1, std::memory_order_relaxed); }
    void record_skipped() { frames_skipped_.fetch_add(1, std::memory_order_relaxed); }
    void record_rejected() { frames_rejected_.fetch_add(1, std::memory_order_relaxed); }
    void record_cancelled() { frames_cancelled_.fetch_add(1, std::memory_order_relaxed); }
    void record_session_started() { sessions_started_.fetch_add(1, std::memory_order_relaxed); }
    void record_session_ended() { sessions_ended_.fetch_add(1, std::memory_order_relaxed); }

    void record_branch_timeout() { branch_timeouts_.fetch_add(1, std::memory_order_relaxed); }
    void record_branch_failure() { branch_failures_.fetch_add(1, std::memory_order_relaxed); }

    void record_processed(double total_ms, bool degraded, bool high_alert) {
        frames_processed_.fetch_add(1, std::memory_order_relaxed);
        if (degraded) degraded_frames_.fetch_add(1, std::memory_order_relaxed);
        if (high_alert) alerts_high_.fetch_add(1, std::memory_order_relaxed);

        std::lock_guard<std::mutex> lock(timing_mutex_);
        processing_us_[processing_idx_] = static_cast<uint64_t>(total_ms * 1000.0);
        processing_idx_ = (processing_idx_ + 1) % PROCESSING_WINDOW;
        if (processing_count_ < PROCESSING_WINDOW) processing_count_++;
    }

    // === Query methods ===

    Summary get_summary() const {
        Summary s;
        s.frames_submitted = frames_submitted_.load(std::memory_order_relaxed);
        s.frames_processed = frames_processed_.load(std::memory_order_relaxed);
        s.frames_skipped = frames_skipped_.load(std::memory_order_relaxed);
        s.frames_rejected = frames_rejected_.load(std::memory_order_relaxed);
        s.frames_cancelled = frames_cancelled_.load(std::memory_order_relaxed);
        s.degraded_frames = degraded_frames_.load(std::memory_order_relaxed);
        s.branch_timeouts = branch_timeouts_.load(std::memory_order_relaxed);
        s.branch_failures = branch_failures_.load(std::memory_order_relaxed);
        s.alerts_high = alerts_high_.load(std::memory_order_relaxed);
        s.sessions_started = sessions_started_.load(std::memory_order_relaxed);
        s.sessions_ended = sessions_ended_.load(std::memory_order_relaxed);

        uint64_t admitted_or_skipped = s.frames_processed + s.frames_skipped;
        s.skip_ratio = admitted_or_skipped > 0
            ? static_cast<double>(s.frames_skipped) / admitted_or_skipped : 0.0;

        std::lock_guard<std::mutex> lock(timing_mutex_);
        if (processing_count_ > 0) {
            uint64_t sum = 0;
            for (size_t i = 0; i < processing_count_; i++) sum += processing_us_[i];
            s.avg_processing_ms = (static_cast<double>(sum) / processing_count_) / 1000.0;
        }
        return s;
    }

    // === Logging callback ===
    void set_log_callback(std::function<void(const Summary&)> callback) {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        log_callback_ = callback;
    }

    static void print_summary(const Summary& s, std::ostream& out = std::cout) {
        out << "[StatsService] STATS"
            << " | Frames: " << s.frames_processed << "/" << s.frames_submitted
            << " | Skipped: " << s.frames_skipped
            << " (" << std::fixed << std::setprecision(1) << s.skip_ratio * 100.0 << "%)"
            << " | Proc: " << std::setprecision(1) << s.avg_processing_ms << "ms"
            << " | Degraded: " << s.degraded_frames
            << " (timeouts " << s.branch_timeouts << ", failures " << s.branch_failures << ")"
            << " | Rejected: " << s.frames_rejected
            << " | High alerts: " << s.alerts_high
            << " | Sessions: " << (s.sessions_started - s.sessions_ended) << " active"
            << std::endl;
    }

private:
    static constexpr size_t PROCESSING_WINDOW = 30;

    std::atomic<bool> running_;
    int log_interval_ms_;

    // Atomic counters (lock-free)
    std::atomic<uint64_t> frames_submitted_{0};
    std::atomic<uint64_t> frames_processed_{0};
    std::atomic<uint64_t> frames_skipped_{0};
    std::atomic<uint64_t> frames_rejected_{0};
    std::atomic<uint64_t> frames_cancelled_{0};
    std::atomic<uint64_t> degraded_frames_{0};
    std::atomic<uint64_t> branch_timeouts_{0};
    std::atomic<uint64_t> branch_failures_{0};
    std::atomic<uint64_t> alerts_high_{0};
    std::atomic<uint64_t> sessions_started_{0};
    std::atomic<uint64_t> sessions_ended_{0};

    // Processing time window
    mutable std::mutex timing_mutex_;
    uint64_t processing_us_[PROCESSING_WINDOW] = {};
    size_t processing_idx_ = 0;
    size_t processing_count_ = 0;

    // Logger thread
    std::thread logger_thread_;
    std::condition_variable cv_;
    std::mutex cv_mutex_;
    std::function<void(const Summary&)> log_callback_;

    void logger_loop() {
        while (running_) {
            std::function<void(const Summary&)> callback;
            {
                std::unique_lock<std::mutex> lock(cv_mutex_);
                cv_.wait_for(lock, std::chrono::milliseconds(log_interval_ms_),
                             [this] { return !running_; });
                if (!running_) break;
                callback = log_callback_;
            }

            auto summary = get_summary();
            print_summary(summary);

            // Custom callback if set
            if (callback) {
                callback(summary);
            }
        }
    }
};

} // namespace proctor
