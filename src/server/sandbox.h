#pragma once

#include "src/server/isolation.h"
#include "src/server/lifecycle_registry.h"
#include "src/server/types.h"

#include <chrono>
#include <string>

namespace evalbox {

struct SandboxOptions {
    ResourceLimits limits;
    std::chrono::milliseconds default_timeout{30000};
    // Crash-safety backstop, enforced by the reaper. Longer than any timeout.
    std::chrono::seconds ttl{300};
    std::string program_file = "main.py";
};

// Runs one program to completion in one freshly provisioned environment.
// Every failure is reported in the outcome; the environment is destroyed and
// unregistered on every path out of Execute.
class Sandbox {
public:
    Sandbox(IsolationClient& client, LifecycleRegistry& registry, SandboxOptions options);

    ExecutionOutcome Execute(const ExecutionRequest& request);

    const SandboxOptions& options() const { return options_; }

private:
    ExecutionOutcome RunProvisioned(const std::string& handle, const ExecutionRequest& request,
                                    std::chrono::milliseconds timeout,
                                    std::chrono::steady_clock::time_point start);

    IsolationClient& client_;
    LifecycleRegistry& registry_;
    SandboxOptions options_;
};

} // namespace evalbox
