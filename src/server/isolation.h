#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace evalbox {

enum class IsolationError {
    kNone,
    kUnavailable,   // backend unreachable or refused to provision
    kTimeout,       // the program outlived its deadline
    kRuntimeFault,  // the environment broke before reporting an exit status
    kDestroyFailed,
};

const char* IsolationErrorName(IsolationError error);

struct ResourceLimits {
    uint64_t memory_bytes = 256ull * 1024 * 1024;
    // CPU share: quota per period, as in CFS bandwidth control.
    uint64_t cpu_quota_micros = 50000;
    uint64_t cpu_period_micros = 100000;
    // Hard CPU-seconds cap for backends without CFS control.
    uint64_t cpu_time_seconds = 30;
    uint64_t max_processes = 64;
    bool network_disabled = true;
    bool read_only_mount = true;
};

// A host directory holding the program, mounted read-only inside the
// environment. entry_file is relative to host_directory.
struct ProgramMount {
    std::string host_directory;
    std::string entry_file;
};

struct ProvisionResult {
    bool success = false;
    std::string handle;
    IsolationError error = IsolationError::kNone;
    std::string error_message;
};

struct RunResult {
    bool success = false;
    // Exit status of the program; 128 + signal number when it was killed.
    int exit_status = -1;
    std::string output;
    IsolationError error = IsolationError::kNone;
    std::string error_message;
};

struct DestroyResult {
    bool success = false;
    // The environment was already gone; still a success.
    bool already_gone = false;
    std::string error_message;
};

// Adapter over an external isolation service.
class IsolationBackend {
public:
    virtual ~IsolationBackend() = default;

    virtual std::string Name() const = 0;

    // Checks that the service is reachable and usable.
    virtual bool Ping(std::string* error_message) = 0;

    virtual ProvisionResult Provision(const ResourceLimits& limits, const ProgramMount& program) = 0;

    // Starts the provisioned program and blocks until it exits or the
    // timeout elapses. Must not wait past the timeout.
    virtual RunResult Run(const std::string& handle,
                          const std::optional<std::string>& input,
                          std::chrono::milliseconds timeout) = 0;

    // Best-effort retrieval of whatever the program printed so far.
    virtual std::optional<std::string> FetchOutput(const std::string& handle) = 0;

    // Stops and removes the environment. Destroying an unknown or already
    // destroyed handle succeeds with already_gone set.
    virtual DestroyResult Destroy(const std::string& handle) = 0;
};

// Front for the isolation backend that remembers whether the backend was
// reachable. A disabled client refuses to provision without touching the
// backend, so callers can report "execution unavailable" instead of hanging.
class IsolationClient {
public:
    explicit IsolationClient(std::unique_ptr<IsolationBackend> backend);

    // Pings the backend once. Leaves the client disabled when the ping fails.
    bool Connect();
    void Disable(const std::string& reason);
    bool IsDisabled() const { return disabled_.load(); }
    std::string DisabledReason() const;
    std::string BackendName() const { return backend_->Name(); }

    ProvisionResult Provision(const ResourceLimits& limits, const ProgramMount& program);
    RunResult Run(const std::string& handle,
                  const std::optional<std::string>& input,
                  std::chrono::milliseconds timeout);
    std::optional<std::string> FetchOutput(const std::string& handle);
    DestroyResult Destroy(const std::string& handle);

private:
    std::unique_ptr<IsolationBackend> backend_;
    std::atomic<bool> disabled_{true};
    mutable std::mutex reason_mutex_;
    std::string disabled_reason_ = "not connected";
};

} // namespace evalbox
