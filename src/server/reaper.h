#pragma once

#include "src/server/isolation.h"
#include "src/server/lifecycle_registry.h"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace evalbox {

// Background sweep that destroys environments past their expiry, whether or
// not their owner is still around. Entries are dropped from the registry
// even when destroy fails; failures are logged and never retried.
class Reaper {
public:
    Reaper(LifecycleRegistry& registry, IsolationClient& client, std::chrono::milliseconds interval);
    ~Reaper();

    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    void Start();

    // Cancels the periodic sweep, joins the thread and destroys every
    // environment still registered.
    void Stop();

    // One tick. Returns the ids that were reaped.
    std::vector<std::string> Sweep();
    std::vector<std::string> Sweep(LifecycleRegistry::Clock::time_point now);

    // Destroys every registered environment regardless of expiry.
    std::vector<std::string> DrainAll();

private:
    void Loop();
    std::vector<std::string> DestroyAll(const std::vector<SandboxHandle>& handles, const char* reason);

    LifecycleRegistry& registry_;
    IsolationClient& client_;
    const std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::condition_variable wakeup_;
    bool stop_requested_ = false;
    std::thread thread_;
};

} // namespace evalbox
