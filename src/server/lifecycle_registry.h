#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace evalbox {

// Provisioned -> Running -> (Completed | TimedOut | Faulted) -> Destroyed.
// Destroyed is terminal; it is reached by leaving the registry.
enum class SandboxState {
    kProvisioned,
    kRunning,
    kCompleted,
    kTimedOut,
    kFaulted,
    kDestroyed,
};

const char* SandboxStateName(SandboxState state);
bool IsValidTransition(SandboxState from, SandboxState to);

struct SandboxHandle {
    using Clock = std::chrono::steady_clock;

    std::string id;
    Clock::time_point created_at;
    Clock::time_point expires_at;
    SandboxState state = SandboxState::kProvisioned;
};

// Every live isolated environment, keyed by backend handle. Shared between
// the execution path that owns an environment and the reaper that destroys
// abandoned ones; removal by either side makes the other side's removal a
// no-op.
class LifecycleRegistry {
public:
    using Clock = SandboxHandle::Clock;

    // Returns false when the id is already registered. A ttl too large for
    // the clock never expires.
    bool Register(const std::string& id, Clock::duration ttl);
    bool Register(const std::string& id, Clock::duration ttl, Clock::time_point now);

    // Returns false when the id was not registered.
    bool Unregister(const std::string& id);

    // Returns false when the id is unknown or the transition goes backwards.
    bool Transition(const std::string& id, SandboxState next);

    std::optional<SandboxHandle> Find(const std::string& id) const;
    size_t Size() const;

    // Removes and returns every entry whose expiry is at or before now.
    std::vector<SandboxHandle> TakeExpired(Clock::time_point now);

    // Removes and returns every entry.
    std::vector<SandboxHandle> TakeAll();

private:
    mutable std::mutex mutex_;
    std::map<std::string, SandboxHandle> handles_;
};

} // namespace evalbox
