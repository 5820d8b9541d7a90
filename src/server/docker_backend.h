#pragma once

#include "src/server/isolation.h"

#include <chrono>
#include <string>
#include <vector>

namespace evalbox {

struct DockerBackendOptions {
    std::string docker_binary = "docker";
    std::string image = "python:3.11-slim";
    std::string interpreter = "python";
    // Where the program directory appears inside the container.
    std::string mount_point = "/code";
    // Bound on every docker CLI call other than the program run itself.
    std::chrono::milliseconds command_timeout{30000};
};

// Drives the Docker daemon through its command line client. Each
// environment is one container created with networking disabled, memory and
// CPU caps, a read-only root filesystem and the program bind-mounted
// read-only.
class DockerBackend : public IsolationBackend {
public:
    explicit DockerBackend(DockerBackendOptions options);

    std::string Name() const override { return "docker"; }
    bool Ping(std::string* error_message) override;
    ProvisionResult Provision(const ResourceLimits& limits, const ProgramMount& program) override;
    RunResult Run(const std::string& handle,
                  const std::optional<std::string>& input,
                  std::chrono::milliseconds timeout) override;
    std::optional<std::string> FetchOutput(const std::string& handle) override;
    DestroyResult Destroy(const std::string& handle) override;

    // Exposed for tests.
    std::vector<std::string> CreateCommand(const ResourceLimits& limits, const ProgramMount& program) const;

private:
    DockerBackendOptions options_;
};

} // namespace evalbox
