#include "src/server/sandbox.h"
#include "src/server/logger.h"
#include "src/server/process.h"

#include <exception>

namespace evalbox {

namespace {

constexpr char kUnavailableError[] = "execution unavailable";

std::chrono::milliseconds Since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

std::string FormatDuration(std::chrono::milliseconds duration) {
    if (duration.count() % 1000 == 0) return std::to_string(duration.count() / 1000) + "s";
    return std::to_string(duration.count()) + "ms";
}

// The program's source on the host, in a private directory that lives as
// long as the execution.
class StagedProgram {
public:
    StagedProgram() : directory_(Process::CreateTempDirectory()) {}
    ~StagedProgram() {
        if (!directory_.empty()) Process::RemoveDirectory(directory_);
    }

    StagedProgram(const StagedProgram&) = delete;
    StagedProgram& operator=(const StagedProgram&) = delete;

    bool Stage(const std::string& file, const std::string& code) {
        return !directory_.empty() && Process::WriteFile(directory_ + "/" + file, code);
    }

    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
};

// Registers a provisioned environment for its lifetime and tears it down on
// every way out of scope. If destroy fails the registry entry stays so the
// reaper gets one more attempt once the ttl runs out.
class SandboxLease {
public:
    SandboxLease(IsolationClient& client, LifecycleRegistry& registry, std::string handle, std::chrono::seconds ttl)
        : client_(client), registry_(registry), handle_(std::move(handle)) {
        registry_.Register(handle_, ttl);
    }

    ~SandboxLease() {
        DestroyResult result;
        try {
            result = client_.Destroy(handle_);
        } catch (const std::exception& e) {
            result.error_message = e.what();
        }

        if (!result.success) {
            Logger::Error("Failed to destroy sandbox ", handle_, ": ", result.error_message,
                          ". Leaving it to the reaper.");
            return;
        }
        if (registry_.Unregister(handle_)) {
            Logger::Debug("Destroyed sandbox ", handle_);
        } else {
            // The reaper got here first.
            Logger::Debug("Sandbox ", handle_, " was already reaped");
        }
    }

    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;

private:
    IsolationClient& client_;
    LifecycleRegistry& registry_;
    std::string handle_;
};

} // namespace

Sandbox::Sandbox(IsolationClient& client, LifecycleRegistry& registry, SandboxOptions options)
    : client_(client), registry_(registry), options_(std::move(options)) {}

ExecutionOutcome Sandbox::Execute(const ExecutionRequest& request) {
    if (client_.IsDisabled()) {
        Logger::Warn("Rejecting execution: isolation backend is disabled (", client_.DisabledReason(), ")");
        return ExecutionOutcome::Unavailable();
    }

    auto start = std::chrono::steady_clock::now();
    std::chrono::milliseconds timeout = request.timeout.value_or(options_.default_timeout);

    StagedProgram program;
    if (!program.Stage(options_.program_file, request.code)) {
        return ExecutionOutcome::Failed("Failed to stage program", std::nullopt, Since(start));
    }

    ProgramMount mount;
    mount.host_directory = program.directory();
    mount.entry_file = options_.program_file;

    ProvisionResult provision;
    try {
        provision = client_.Provision(options_.limits, mount);
    } catch (const std::exception& e) {
        Logger::Error("Provisioning threw: ", e.what());
        return ExecutionOutcome::Failed(std::string("Execution fault: ") + e.what(), std::nullopt, Since(start));
    }
    if (!provision.success) {
        std::string error = provision.error_message == kUnavailableError
                                ? provision.error_message
                                : std::string(kUnavailableError) + ": " + provision.error_message;
        return ExecutionOutcome::Failed(error, std::nullopt, Since(start));
    }

    SandboxLease lease(client_, registry_, provision.handle, options_.ttl);
    return RunProvisioned(provision.handle, request, timeout, start);
}

ExecutionOutcome Sandbox::RunProvisioned(const std::string& handle, const ExecutionRequest& request,
                                         std::chrono::milliseconds timeout,
                                         std::chrono::steady_clock::time_point start) {
    registry_.Transition(handle, SandboxState::kRunning);
    Logger::Info("Running sandbox ", handle, " with timeout ", FormatDuration(timeout));

    RunResult run;
    try {
        run = client_.Run(handle, request.input, timeout);
    } catch (const std::exception& e) {
        run = RunResult{};
        run.error = IsolationError::kRuntimeFault;
        run.error_message = e.what();
    }

    if (run.success) {
        registry_.Transition(handle, SandboxState::kCompleted);
        if (run.exit_status == 0) {
            Logger::Info("Sandbox ", handle, " finished successfully");
            return ExecutionOutcome::Succeeded(std::move(run.output), 0, Since(start));
        }
        Logger::Info("Sandbox ", handle, " exited with code ", run.exit_status);
        ExecutionOutcome outcome = ExecutionOutcome::Failed(
            "Process exited with code " + std::to_string(run.exit_status), std::move(run.output), Since(start));
        outcome.exit_code = run.exit_status;
        return outcome;
    }

    bool timed_out = run.error == IsolationError::kTimeout;
    registry_.Transition(handle, timed_out ? SandboxState::kTimedOut : SandboxState::kFaulted);
    Logger::Warn("Sandbox ", handle, " ", IsolationErrorName(run.error), ": ", run.error_message);

    std::optional<std::string> output;
    try {
        output = client_.FetchOutput(handle);
    } catch (const std::exception& e) {
        Logger::Warn("Could not retrieve output of sandbox ", handle, ": ", e.what());
    }
    if (!output && !run.output.empty()) output = std::move(run.output);

    std::string error = timed_out ? "Execution timeout: exceeded " + FormatDuration(timeout)
                                  : "Execution fault: " + run.error_message;
    ExecutionOutcome outcome = ExecutionOutcome::Failed(std::move(error), std::move(output), Since(start));
    outcome.timed_out = timed_out;
    return outcome;
}

} // namespace evalbox
