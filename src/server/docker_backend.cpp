#include "src/server/docker_backend.h"
#include "src/server/logger.h"
#include "src/server/process.h"

namespace evalbox {

namespace {

std::string TrimOutput(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string DescribeFailure(const ProcessResult& result) {
    if (!result.started) return result.error_message;
    if (result.timed_out) return "docker command timed out";
    std::string output = TrimOutput(result.output);
    if (output.empty()) return "docker exited with code " + std::to_string(result.exit_code);
    return output;
}

bool IsNoSuchContainer(const std::string& output) {
    return output.find("No such container") != std::string::npos;
}

// The CLI prefixes daemon-side failures (OCI runtime errors, missing image,
// bad mounts) this way; a program that actually ran never gets them.
bool IsDaemonError(const ProcessResult& result) {
    return result.exit_code != 0 && result.output.find("Error response from daemon:") != std::string::npos;
}

} // namespace

DockerBackend::DockerBackend(DockerBackendOptions options) : options_(std::move(options)) {}

bool DockerBackend::Ping(std::string* error_message) {
    ProcessOptions process_options;
    process_options.timeout = options_.command_timeout;
    ProcessResult result = Process::Run(
        {options_.docker_binary, "version", "--format", "{{.Server.Version}}"}, process_options);
    if (!result.Succeeded()) {
        if (error_message) *error_message = "Docker daemon not reachable: " + DescribeFailure(result);
        return false;
    }
    Logger::Info("Docker server version ", TrimOutput(result.output));
    return true;
}

std::vector<std::string> DockerBackend::CreateCommand(const ResourceLimits& limits,
                                                      const ProgramMount& program) const {
    std::vector<std::string> argv = {
        options_.docker_binary, "create",
        "--interactive",
        "--network", limits.network_disabled ? "none" : "bridge",
        "--memory", std::to_string(limits.memory_bytes),
        "--memory-swap", std::to_string(limits.memory_bytes),
        "--cpu-period", std::to_string(limits.cpu_period_micros),
        "--cpu-quota", std::to_string(limits.cpu_quota_micros),
        "--pids-limit", std::to_string(limits.max_processes),
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--label", "evalbox.sandbox=1",
    };
    if (limits.read_only_mount) argv.push_back("--read-only");
    argv.push_back("--volume");
    argv.push_back(program.host_directory + ":" + options_.mount_point +
                   (limits.read_only_mount ? ":ro" : ":rw"));
    argv.push_back(options_.image);
    argv.push_back(options_.interpreter);
    argv.push_back(options_.mount_point + "/" + program.entry_file);
    return argv;
}

ProvisionResult DockerBackend::Provision(const ResourceLimits& limits, const ProgramMount& program) {
    ProvisionResult provision;
    ProcessOptions process_options;
    process_options.timeout = options_.command_timeout;
    ProcessResult result = Process::Run(CreateCommand(limits, program), process_options);
    if (!result.Succeeded()) {
        provision.error = IsolationError::kUnavailable;
        provision.error_message = "Failed to create container: " + DescribeFailure(result);
        Logger::Error(provision.error_message);
        return provision;
    }

    // `docker create` may print pull progress before the id; the id is the last line.
    std::string output = TrimOutput(result.output);
    size_t last_line = output.find_last_of('\n');
    provision.handle = last_line == std::string::npos ? output : output.substr(last_line + 1);
    if (provision.handle.empty()) {
        provision.error = IsolationError::kUnavailable;
        provision.error_message = "docker create returned no container id";
        return provision;
    }
    provision.success = true;
    Logger::Info("Created container ", provision.handle);
    return provision;
}

RunResult DockerBackend::Run(const std::string& handle,
                             const std::optional<std::string>& input,
                             std::chrono::milliseconds timeout) {
    RunResult run;
    ProcessOptions process_options;
    process_options.stdin_data = input;
    process_options.timeout = timeout;
    ProcessResult result = Process::Run(
        {options_.docker_binary, "start", "--attach", "--interactive", handle}, process_options);
    run.output = result.output;

    if (result.timed_out) {
        // Only the attached client was killed; the container keeps running
        // until Destroy.
        run.error = IsolationError::kTimeout;
        run.error_message = "timed out after " + std::to_string(timeout.count()) + "ms";
        return run;
    }
    if (!result.started || result.term_signal != 0) {
        run.error = IsolationError::kRuntimeFault;
        run.error_message = result.started ? "docker client killed by signal " + std::to_string(result.term_signal)
                                           : result.error_message;
        return run;
    }
    if (IsNoSuchContainer(result.output)) {
        run.error = IsolationError::kRuntimeFault;
        run.error_message = "container " + handle + " disappeared before it started";
        return run;
    }
    if (IsDaemonError(result)) {
        run.error = IsolationError::kRuntimeFault;
        run.error_message = "container " + handle + " failed to start: " + DescribeFailure(result);
        return run;
    }
    run.success = true;
    run.exit_status = result.exit_code;
    return run;
}

std::optional<std::string> DockerBackend::FetchOutput(const std::string& handle) {
    ProcessOptions process_options;
    process_options.timeout = options_.command_timeout;
    ProcessResult result = Process::Run({options_.docker_binary, "logs", handle}, process_options);
    if (!result.Succeeded()) {
        Logger::Warn("Could not fetch logs for container ", handle, ": ", DescribeFailure(result));
        return std::nullopt;
    }
    return result.output;
}

DestroyResult DockerBackend::Destroy(const std::string& handle) {
    DestroyResult destroy;
    ProcessOptions process_options;
    process_options.timeout = options_.command_timeout;
    ProcessResult result = Process::Run({options_.docker_binary, "rm", "--force", handle}, process_options);
    if (result.Succeeded()) {
        destroy.success = true;
        return destroy;
    }
    if (result.started && IsNoSuchContainer(result.output)) {
        destroy.success = true;
        destroy.already_gone = true;
        return destroy;
    }
    destroy.error_message = DescribeFailure(result);
    return destroy;
}

} // namespace evalbox
