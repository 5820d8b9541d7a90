#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace evalbox {

struct ProcessOptions {
    // Bytes written to the child's stdin. When unset the child reads EOF.
    std::optional<std::string> stdin_data;

    // Hard wall-clock deadline. On expiry the child's whole process group is
    // killed with SIGKILL.
    std::optional<std::chrono::milliseconds> timeout;

    // Runs in the forked child right before exec. Returns nullptr on success
    // or a static description of the step that failed; errno is reported
    // alongside it. Must stick to async-signal-safe calls.
    std::function<const char*()> child_setup;

    // Called in the parent with the child's pid (also its process group id).
    std::function<void(pid_t)> on_spawn;

    // Output past this many bytes is drained and dropped.
    size_t max_output_bytes = 4 * 1024 * 1024;
};

struct ProcessResult {
    // False when the child could not be spawned or its setup failed before
    // exec; error_message explains why.
    bool started = false;
    int exit_code = -1;
    int term_signal = 0;
    bool timed_out = false;
    bool output_truncated = false;
    // Interleaved stdout and stderr.
    std::string output;
    std::chrono::milliseconds elapsed{0};
    std::string error_message;

    bool Succeeded() const { return started && !timed_out && exit_code == 0; }
};

class Process {
public:
    static std::string CreateTempDirectory();
    static bool RemoveDirectory(const std::string& path);
    static bool WriteFile(const std::string& path, const std::string& content);

    // Runs argv[0] (looked up in PATH) to completion or until the deadline.
    static ProcessResult Run(const std::vector<std::string>& argv,
                             const ProcessOptions& options = {});
};

} // namespace evalbox
