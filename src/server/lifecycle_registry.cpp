#include "src/server/lifecycle_registry.h"
#include "src/server/logger.h"

namespace evalbox {

const char* SandboxStateName(SandboxState state) {
    switch (state) {
        case SandboxState::kProvisioned: return "provisioned";
        case SandboxState::kRunning: return "running";
        case SandboxState::kCompleted: return "completed";
        case SandboxState::kTimedOut: return "timed out";
        case SandboxState::kFaulted: return "faulted";
        case SandboxState::kDestroyed: return "destroyed";
    }
    return "unknown";
}

bool IsValidTransition(SandboxState from, SandboxState to) {
    switch (from) {
        case SandboxState::kProvisioned:
            return to == SandboxState::kRunning || to == SandboxState::kFaulted ||
                   to == SandboxState::kDestroyed;
        case SandboxState::kRunning:
            return to == SandboxState::kCompleted || to == SandboxState::kTimedOut ||
                   to == SandboxState::kFaulted || to == SandboxState::kDestroyed;
        case SandboxState::kCompleted:
        case SandboxState::kTimedOut:
        case SandboxState::kFaulted:
            return to == SandboxState::kDestroyed;
        case SandboxState::kDestroyed:
            return false;
    }
    return false;
}

bool LifecycleRegistry::Register(const std::string& id, Clock::duration ttl) {
    return Register(id, ttl, Clock::now());
}

bool LifecycleRegistry::Register(const std::string& id, Clock::duration ttl, Clock::time_point now) {
    SandboxHandle handle;
    handle.id = id;
    handle.created_at = now;
    if (ttl < Clock::duration::zero()) ttl = Clock::duration::zero();
    handle.expires_at = ttl >= Clock::time_point::max() - now ? Clock::time_point::max() : now + ttl;

    std::lock_guard<std::mutex> lock(mutex_);
    bool inserted = handles_.emplace(id, handle).second;
    if (!inserted) {
        Logger::Warn("Sandbox ", id, " is already registered");
    }
    return inserted;
}

bool LifecycleRegistry::Unregister(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.erase(id) > 0;
}

bool LifecycleRegistry::Transition(const std::string& id, SandboxState next) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(id);
    if (it == handles_.end()) return false;
    if (!IsValidTransition(it->second.state, next)) {
        Logger::Warn("Rejected sandbox ", id, " transition ", SandboxStateName(it->second.state),
                     " -> ", SandboxStateName(next));
        return false;
    }
    it->second.state = next;
    return true;
}

std::optional<SandboxHandle> LifecycleRegistry::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(id);
    if (it == handles_.end()) return std::nullopt;
    return it->second;
}

size_t LifecycleRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

std::vector<SandboxHandle> LifecycleRegistry::TakeExpired(Clock::time_point now) {
    std::vector<SandboxHandle> expired;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = handles_.begin(); it != handles_.end();) {
        if (it->second.expires_at <= now) {
            expired.push_back(std::move(it->second));
            it = handles_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

std::vector<SandboxHandle> LifecycleRegistry::TakeAll() {
    std::vector<SandboxHandle> all;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : handles_) {
        all.push_back(std::move(entry.second));
    }
    handles_.clear();
    return all;
}

} // namespace evalbox
