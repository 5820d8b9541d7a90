#include "src/server/reaper.h"
#include "src/server/logger.h"

#include <exception>

namespace evalbox {

Reaper::Reaper(LifecycleRegistry& registry, IsolationClient& client, std::chrono::milliseconds interval)
    : registry_(registry), client_(client), interval_(interval) {}

Reaper::~Reaper() { Stop(); }

void Reaper::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) return;
    stop_requested_ = false;
    thread_ = std::thread([this]() { Loop(); });
    Logger::Info("Reaper started, sweeping every ", interval_.count(), "ms");
}

void Reaper::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    wakeup_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
        Logger::Info("Reaper stopped");
    }

    std::vector<std::string> drained = DrainAll();
    if (!drained.empty()) {
        Logger::Info("Destroyed ", drained.size(), " sandbox(es) left at shutdown");
    }
}

void Reaper::Loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (wakeup_.wait_for(lock, interval_, [this]() { return stop_requested_; })) break;
        lock.unlock();
        Sweep();
        lock.lock();
    }
}

std::vector<std::string> Reaper::Sweep() {
    return Sweep(LifecycleRegistry::Clock::now());
}

std::vector<std::string> Reaper::Sweep(LifecycleRegistry::Clock::time_point now) {
    // Entries leave the registry under its lock; destroying happens outside
    // it so new registrations are never blocked by a slow backend.
    return DestroyAll(registry_.TakeExpired(now), "expired");
}

std::vector<std::string> Reaper::DrainAll() {
    return DestroyAll(registry_.TakeAll(), "shutdown");
}

std::vector<std::string> Reaper::DestroyAll(const std::vector<SandboxHandle>& handles, const char* reason) {
    std::vector<std::string> reaped;
    for (const auto& handle : handles) {
        DestroyResult result;
        try {
            result = client_.Destroy(handle.id);
        } catch (const std::exception& e) {
            result.error_message = e.what();
        }
        if (result.success) {
            Logger::Info("Reaped sandbox ", handle.id, " (", reason, ", was ",
                         SandboxStateName(handle.state), ")");
        } else {
            Logger::Error("Failed to destroy sandbox ", handle.id, " (", reason, "): ",
                          result.error_message, ". Not retrying.");
        }
        reaped.push_back(handle.id);
    }
    return reaped;
}

} // namespace evalbox
