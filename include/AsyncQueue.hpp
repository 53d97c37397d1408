#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace proctor {

/**
 * @brief Thread-safe bounded queue between a transport thread and a session
 *
 * When full, push() either drops the oldest item (live streams, where a stale
 * frame is worth less than a fresh one) or refuses the new one.
 */
template<typename T>
class AsyncQueue {
public:
    enum class OverflowPolicy {
        DROP_OLDEST,
        REJECT_NEW
    };

    explicit AsyncQueue(size_t max_size = 100, OverflowPolicy policy = OverflowPolicy::DROP_OLDEST)
        : max_size_(max_size == 0 ? 1 : max_size), policy_(policy) {}

    // Returns false if the queue is stopped or the item was refused
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return false;

            if (queue_.size() >= max_size_) {
                if (policy_ == OverflowPolicy::REJECT_NEW) {
                    dropped_++;
                    return false;
                }
                queue_.pop_front();  // Drop oldest
                dropped_++;
            }

            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // Blocking pop with timeout. After stop() the remaining items still drain.
    std::optional<T> pop(int timeout_ms = 100) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                          [this] { return !queue_.empty() || !running_; })) {
            return std::nullopt;
        }

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    // Non-blocking try_pop
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_all();
    }

    bool is_running() const { return running_; }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const { return size() == 0; }

    uint64_t dropped_count() const {
        return dropped_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    size_t max_size_;
    OverflowPolicy policy_;
    std::atomic<bool> running_{true};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace proctor
