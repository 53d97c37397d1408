#pragma once

#include "BehaviorWindow.hpp"
#include "FrameSampler.hpp"
#include "HeadPoseEstimator.hpp"
#include "PipelineResult.hpp"
#include "WorkerPool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace proctor {

/**
 * @brief All mutable state of one exam session
 *
 * Frames of a session are processed under mutex, one at a time. The cancel
 * flag is read without the mutex so end_session() can abort a frame that is
 * waiting on its detectors.
 *
 * Each session runs its detection branches on its own executor, so a slow or
 * hung provider call only ever delays the session that made it. Destroying
 * the state joins any branch still inside a provider.
 */
struct SessionState {
    explicit SessionState(std::string id, size_t branch_threads = 2);

    const std::string session_id;
    const std::chrono::steady_clock::time_point started_at;

    std::mutex mutex;

    SamplerState sampler;
    DeviationState deviation;
    BehaviorWindowState window;
    std::optional<PipelineResult> last_result;

    WorkerPool executor;

    uint64_t frames_submitted = 0;
    uint64_t frames_processed = 0;
    uint64_t frames_skipped = 0;
    uint64_t frames_degraded = 0;

    std::shared_ptr<std::atomic<bool>> cancelled;

    bool is_ended() const { return cancelled->load(); }
};

/**
 * @brief Session id -> owned session state
 *
 * Lookups fail closed: an unknown id returns nullptr and nothing is created
 * implicitly. Insert and remove are atomic with respect to each other.
 */
class SessionRegistry {
public:
    enum class CreateStatus {
        CREATED,
        ALREADY_EXISTS,
        CAPACITY_REACHED,
        INVALID_ID
    };

    /**
     * @param max_sessions Upper bound on live sessions, 0 = unlimited
     */
    explicit SessionRegistry(size_t max_sessions = 0);

    /**
     * @param branch_threads Size of the session's detection executor
     */
    CreateStatus create(const std::string& session_id, size_t branch_threads = 2);

    std::shared_ptr<SessionState> find(const std::string& session_id) const;

    /**
     * @brief Remove a session and raise its cancel flag
     * @return The removed state, or nullptr if the id was unknown
     */
    std::shared_ptr<SessionState> remove(const std::string& session_id);

    /**
     * @brief End every session
     */
    void clear();

    bool contains(const std::string& session_id) const;
    size_t size() const;
    size_t capacity() const { return max_sessions_; }
    std::vector<std::string> session_ids() const;

    static const char* create_status_to_string(CreateStatus status);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionState>> sessions_;
    size_t max_sessions_;
};

} // namespace proctor
