#pragma once

#include "src/server/isolation.h"
#include "src/server/process.h"

#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <sys/types.h>
#include <vector>

namespace evalbox {

struct NamespaceBackendOptions {
    std::string interpreter = "python3";
    // -B: never write bytecode caches next to the read-only program.
    std::vector<std::string> interpreter_flags = {"-B"};
    // Where the program directory appears inside the sandbox.
    std::string mount_point = "/code";
    // Host directories bound read-only into the sandbox root. Symlinks are
    // recreated as links; missing paths are skipped.
    std::vector<std::string> system_paths = {"/bin", "/etc", "/lib", "/lib32", "/lib64", "/libx32", "/sbin", "/usr"};
};

// Runs the interpreter on this host inside fresh user, mount, pid, network
// and IPC namespaces. The sandbox sees a private tmpfs root with read-only
// system directories, the program directory read-only at mount_point and an
// empty /tmp; nothing else of the host filesystem. The program is pid 1 of
// its namespace, so every descendant dies with it. rlimits bound memory, CPU
// time and process count, and all capabilities are dropped before exec.
// Needs unprivileged user namespaces.
class NamespaceBackend : public IsolationBackend {
public:
    explicit NamespaceBackend(NamespaceBackendOptions options);

    std::string Name() const override { return "namespace"; }
    bool Ping(std::string* error_message) override;
    ProvisionResult Provision(const ResourceLimits& limits, const ProgramMount& program) override;
    RunResult Run(const std::string& handle,
                  const std::optional<std::string>& input,
                  std::chrono::milliseconds timeout) override;
    std::optional<std::string> FetchOutput(const std::string& handle) override;
    DestroyResult Destroy(const std::string& handle) override;

private:
    struct Environment {
        ResourceLimits limits;
        ProgramMount program;
        // Process group of the running program, 0 when nothing runs.
        pid_t pid = 0;
        bool destroyed = false;
        std::string output;
    };

    ProcessOptions MakeProcessOptions(const ResourceLimits& limits, const std::string& program_directory,
                                      const std::string& root) const;
    std::vector<std::string> InterpreterCommand(const std::string& entry_file) const;
    std::shared_ptr<Environment> Find(const std::string& handle);
    std::string NextHandle();

    NamespaceBackendOptions options_;
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Environment>> environments_;
    std::mt19937_64 random_;
};

} // namespace evalbox
