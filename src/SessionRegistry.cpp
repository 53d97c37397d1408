#include "SessionRegistry.hpp"

#include <algorithm>
#include <utility>

namespace proctor {

SessionState::SessionState(std::string id, size_t branch_threads)
    : session_id(std::move(id)),
      started_at(std::chrono::steady_clock::now()),
      executor(branch_threads),
      cancelled(std::make_shared<std::atomic<bool>>(false)) {
}

SessionRegistry::SessionRegistry(size_t max_sessions)
    : max_sessions_(max_sessions) {
}

const char* SessionRegistry::create_status_to_string(CreateStatus status) {
    switch (status) {
        case CreateStatus::CREATED:          return "created";
        case CreateStatus::ALREADY_EXISTS:   return "already_exists";
        case CreateStatus::CAPACITY_REACHED: return "capacity_reached";
        case CreateStatus::INVALID_ID:       return "invalid_id";
    }
    return "unknown";
}

SessionRegistry::CreateStatus SessionRegistry::create(const std::string& session_id, size_t branch_threads) {
    if (session_id.empty()) {
        return CreateStatus::INVALID_ID;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(session_id) > 0) {
        return CreateStatus::ALREADY_EXISTS;
    }
    if (max_sessions_ > 0 && sessions_.size() >= max_sessions_) {
        return CreateStatus::CAPACITY_REACHED;
    }

    sessions_.emplace(session_id, std::make_shared<SessionState>(session_id, branch_threads));
    return CreateStatus::CREATED;
}

std::shared_ptr<SessionState> SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<SessionState> SessionRegistry::remove(const std::string& session_id) {
    std::shared_ptr<SessionState> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return nullptr;
        }
        removed = it->second;
        sessions_.erase(it);
    }

    // In-flight work holds its own reference; the flag tells it to stop
    removed->cancelled->store(true);
    return removed;
}

void SessionRegistry::clear() {
    std::unordered_map<std::string, std::shared_ptr<SessionState>> ended;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ended.swap(sessions_);
    }
    for (auto& entry : ended) {
        entry.second->cancelled->store(true);
    }
}

bool SessionRegistry::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::session_ids() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(sessions_.size());
        for (const auto& entry : sessions_) {
            ids.push_back(entry.first);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace proctor
