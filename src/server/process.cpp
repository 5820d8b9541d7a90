#include "src/server/process.h"
#include "src/server/logger.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <limits>
#include <mutex>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace evalbox {

namespace fs = std::filesystem;

namespace {

constexpr int kChildSetupFailedExitCode = 127;
// How long to keep draining output after the process group was killed.
constexpr std::chrono::milliseconds kKillGracePeriod{1000};

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    ~UniqueFd() { Reset(); }

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset(int fd = -1) {
        if (fd_ >= 0) close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

bool MakePipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1) return false;
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return true;
}

// Only async-signal-safe calls from here on; this runs between fork and exec.
[[noreturn]] void ReportChildFailure(int fd, const char* what) {
    int saved_errno = errno;
    const char* reason = strerror(saved_errno);
    ssize_t ignored = write(fd, what, strlen(what));
    ignored = write(fd, ": ", 2);
    ignored = write(fd, reason, strlen(reason));
    (void)ignored;
    _exit(kChildSetupFailedExitCode);
}

void IgnoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] { signal(SIGPIPE, SIG_IGN); });
}

// Rounds up so the loop never wakes just short of the deadline.
int ToPollTimeout(std::chrono::steady_clock::duration d) {
    if (d <= std::chrono::steady_clock::duration::zero()) return 0;
    auto millis = std::chrono::ceil<std::chrono::milliseconds>(d).count();
    return millis > std::numeric_limits<int>::max() ? std::numeric_limits<int>::max() : static_cast<int>(millis);
}

} // namespace

std::string Process::CreateTempDirectory() {
    char template_str[] = "/tmp/evalbox_run_XXXXXX";
    char* path = mkdtemp(template_str);
    if (!path) {
        Logger::Error("Failed to create temporary directory: ", strerror(errno));
        return "";
    }
    // Sandboxed interpreters may run as another user; the mount itself is read-only.
    if (chmod(path, 0755) == -1) {
        Logger::Warn("Failed to chmod ", path, ": ", strerror(errno));
    }
    Logger::Debug("Created temporary directory: ", path);
    return std::string(path);
}

bool Process::RemoveDirectory(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return false;
    fs::remove_all(path, ec);
    if (ec) {
        Logger::Error("Failed to remove directory: ", path, " - ", ec.message());
        return false;
    }
    Logger::Debug("Removed directory: ", path);
    return true;
}

bool Process::WriteFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        Logger::Error("Failed to open file for writing: ", path);
        return false;
    }
    out << content;
    out.close();
    if (!out) {
        Logger::Error("Failed to write file: ", path);
        return false;
    }
    return true;
}

ProcessResult Process::Run(const std::vector<std::string>& argv, const ProcessOptions& options) {
    ProcessResult result;
    if (argv.empty()) {
        result.error_message = "Empty command line";
        return result;
    }

    IgnoreSigpipeOnce();

    UniqueFd stdin_read, stdin_write;
    UniqueFd output_read, output_write;
    UniqueFd status_read, status_write;
    if (!MakePipe(stdin_read, stdin_write) || !MakePipe(output_read, output_write) ||
        !MakePipe(status_read, status_write)) {
        result.error_message = std::string("Failed to create pipes: ") + strerror(errno);
        Logger::Error(result.error_message);
        return result;
    }

    // Built before fork so the child does not allocate.
    std::vector<char*> c_argv;
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid == -1) {
        result.error_message = std::string("Failed to fork: ") + strerror(errno);
        Logger::Error(result.error_message);
        return result;
    }

    if (pid == 0) {
        // Child process
        int status_fd = status_write.Get();
        if (setpgid(0, 0) == -1) ReportChildFailure(status_fd, "setpgid");

        // Undo what the parent blocked or ignored; both survive exec.
        sigset_t no_signals;
        sigemptyset(&no_signals);
        sigprocmask(SIG_SETMASK, &no_signals, nullptr);
        signal(SIGPIPE, SIG_DFL);

        if (dup2(stdin_read.Get(), STDIN_FILENO) == -1 ||
            dup2(output_write.Get(), STDOUT_FILENO) == -1 ||
            dup2(output_write.Get(), STDERR_FILENO) == -1) {
            ReportChildFailure(status_fd, "dup2");
        }

        if (options.child_setup) {
            const char* failed_step = options.child_setup();
            if (failed_step) ReportChildFailure(status_fd, failed_step);
        }

        execvp(c_argv[0], c_argv.data());
        ReportChildFailure(status_fd, "exec");
    }

    // Parent process. Also set here to close the race with the child's setpgid.
    setpgid(pid, pid);
    if (options.on_spawn) options.on_spawn(pid);

    stdin_read.Reset();
    output_write.Reset();
    status_write.Reset();

    const std::string& input = options.stdin_data ? *options.stdin_data : std::string();
    size_t input_written = 0;
    if (input.empty()) {
        stdin_write.Reset();
    } else {
        fcntl(stdin_write.Get(), F_SETFL, fcntl(stdin_write.Get(), F_GETFL) | O_NONBLOCK);
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (options.timeout) deadline = start + *options.timeout;
    std::chrono::steady_clock::time_point killed_at;

    char buffer[4096];
    bool output_open = true;
    while (output_open) {
        auto now = std::chrono::steady_clock::now();
        if (deadline && !result.timed_out && now >= *deadline) {
            kill(-pid, SIGKILL);
            result.timed_out = true;
            killed_at = now;
            stdin_write.Reset();
        }
        if (result.timed_out && now - killed_at >= kKillGracePeriod) {
            // Something outside the process group still holds the pipe.
            break;
        }

        pollfd fds[2];
        nfds_t fd_count = 1;
        fds[0] = {output_read.Get(), POLLIN, 0};
        if (stdin_write.Valid()) {
            fds[1] = {stdin_write.Get(), POLLOUT, 0};
            fd_count = 2;
        }

        int wait_ms = -1;
        if (result.timed_out) {
            wait_ms = ToPollTimeout(killed_at + kKillGracePeriod - now);
        } else if (deadline) {
            wait_ms = ToPollTimeout(*deadline - now);
        }

        int activity = poll(fds, fd_count, wait_ms);
        if (activity < 0) {
            if (errno == EINTR) continue;
            Logger::Error("Poll error: ", strerror(errno));
            kill(-pid, SIGKILL);
            break;
        }
        if (activity == 0) continue;

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t bytes = read(output_read.Get(), buffer, sizeof(buffer));
            if (bytes > 0) {
                size_t room = options.max_output_bytes - std::min(options.max_output_bytes, result.output.size());
                size_t keep = std::min(room, static_cast<size_t>(bytes));
                result.output.append(buffer, keep);
                if (keep < static_cast<size_t>(bytes)) result.output_truncated = true;
            } else if (bytes == 0 || errno != EINTR) {
                output_open = false;
            }
        }

        if (fd_count == 2 && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t bytes = write(stdin_write.Get(), input.data() + input_written, input.size() - input_written);
            if (bytes > 0) {
                input_written += static_cast<size_t>(bytes);
                if (input_written == input.size()) stdin_write.Reset();
            } else if (bytes < 0 && errno != EAGAIN && errno != EINTR) {
                // EPIPE: the child stopped reading.
                stdin_write.Reset();
            }
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    std::string setup_failure;
    ssize_t bytes;
    while ((bytes = read(status_read.Get(), buffer, sizeof(buffer))) > 0) {
        setup_failure.append(buffer, static_cast<size_t>(bytes));
    }
    if (!setup_failure.empty()) {
        result.error_message = "Failed to start " + argv[0] + ": " + setup_failure;
        Logger::Warn(result.error_message);
        return result;
    }

    result.started = true;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
    return result;
}

} // namespace evalbox
