#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace proctor {

/**
 * @brief Fixed-size thread pool
 *
 * Each session owns one to run its pose and object detection branches. Tasks
 * are served in submission order; a task that throws stores the exception in
 * its future and the worker keeps running.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads = 2) {
        if (num_threads == 0) num_threads = 1;
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back(&WorkerPool::worker_loop, this);
        }
    }

    ~WorkerPool() {
        shutdown();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a callable taking no arguments
     * @throws std::runtime_error after shutdown()
     */
    template<class F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;

        auto job = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = job->get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("WorkerPool is shut down");
            }
            queue_.emplace_back([job] { (*job)(); });
            tasks_submitted_++;
        }
        work_ready_.notify_one();
        return result;
    }

    /**
     * @brief Finish queued tasks, then join the workers. Idempotent.
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ && workers_.empty()) return;
            stopping_ = true;
        }
        work_ready_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
        workers_.clear();
    }

    // Block until nothing is queued or running
    void wait_all() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
    }

    size_t pending_tasks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t thread_count() const { return workers_.size(); }
    uint64_t submitted_count() const { return tasks_submitted_; }
    uint64_t completed_count() const { return tasks_completed_; }

private:
    void worker_loop() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                work_ready_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (queue_.empty()) return;   // stopping and drained

                job = std::move(queue_.front());
                queue_.pop_front();
                running_++;
            }

            // packaged_task captures exceptions into the future
            job();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                running_--;
                tasks_completed_++;
            }
            idle_.notify_all();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;

    mutable std::mutex mutex_;
    std::condition_variable work_ready_;
    std::condition_variable idle_;
    bool stopping_ = false;
    size_t running_ = 0;

    std::atomic<uint64_t> tasks_submitted_{0};
    std::atomic<uint64_t> tasks_completed_{0};
};

} // namespace proctor
