#include "src/server/namespace_backend.h"
#include "src/server/logger.h"
#include "src/server/process.h"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <linux/capability.h>
#include <sched.h>
#include <sstream>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace evalbox {

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds kPingTimeout{10000};
constexpr int kSupervisorFailedExitCode = 126;

// A host path made visible inside the sandbox root: a recursive read-only
// bind mount, the same link for symlinks such as /bin -> usr/bin, or a
// read-only remount of a submount the recursive bind brought along.
struct SystemMount {
    std::string source;
    std::string target;
    std::string link_target;
    unsigned long remount_flags = 0;
    bool remount_only = false;
};

// Everything the child needs, computed before fork.
struct SandboxSetup {
    // Empty host directory the private tmpfs root is mounted on.
    std::string root;
    std::string program_source;
    std::string program_target;
    unsigned long program_remount_flags = 0;
    std::string tmp_target;
    std::string work_directory;
    std::vector<SystemMount> system_mounts;
    char uid_map[64];
    char gid_map[64];
    ResourceLimits limits;
};

bool WriteProcFile(const char* path, const char* data) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd == -1) return false;
    ssize_t length = static_cast<ssize_t>(strlen(data));
    bool ok = write(fd, data, static_cast<size_t>(length)) == length;
    close(fd);
    return ok;
}

bool SetLimit(int resource, uint64_t value) {
    rlimit limit;
    limit.rlim_cur = value;
    limit.rlim_max = value;
    return setrlimit(resource, &limit) == 0;
}

// Bind remounts inside a user namespace must keep the locked flags of the
// source mount, so carry them over.
unsigned long InheritedMountFlags(const std::string& path) {
    unsigned long flags = MS_NOSUID | MS_NODEV;
    struct statvfs info;
    if (statvfs(path.c_str(), &info) != 0) return flags;
    if (info.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    if (info.f_flag & ST_NOATIME) flags |= MS_NOATIME;
    if (info.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
    if (info.f_flag & ST_RELATIME) flags |= MS_RELATIME;
    return flags;
}

bool IsOctal(char c) { return c >= '0' && c <= '7'; }

// Undoes the octal escapes (\040 for space) of /proc/self/mountinfo.
std::string UnescapeMountPath(const std::string& path) {
    std::string unescaped;
    for (size_t i = 0; i < path.size(); ++i) {
        if (path[i] == '\\' && i + 3 < path.size() && IsOctal(path[i + 1]) && IsOctal(path[i + 2]) &&
            IsOctal(path[i + 3])) {
            unescaped += static_cast<char>((path[i + 1] - '0') * 64 + (path[i + 2] - '0') * 8 + (path[i + 3] - '0'));
            i += 3;
        } else {
            unescaped += path[i];
        }
    }
    return unescaped;
}

std::vector<std::string> MountPointsUnder(const std::string& directory) {
    std::vector<std::string> mount_points;
    std::ifstream mountinfo("/proc/self/mountinfo");
    std::string line;
    while (std::getline(mountinfo, line)) {
        std::istringstream fields(line);
        std::string id, parent, device, root, mount_point;
        if (!(fields >> id >> parent >> device >> root >> mount_point)) continue;
        mount_point = UnescapeMountPath(mount_point);
        if (mount_point.size() > directory.size() && mount_point.compare(0, directory.size(), directory) == 0 &&
            mount_point[directory.size()] == '/') {
            mount_points.push_back(mount_point);
        }
    }
    return mount_points;
}

SandboxSetup MakeSetup(const NamespaceBackendOptions& options, const ResourceLimits& limits,
                       const std::string& program_directory, const std::string& root) {
    SandboxSetup setup;
    setup.root = root;
    setup.program_source = program_directory;
    setup.program_target = root + options.mount_point;
    setup.program_remount_flags = MS_BIND | MS_REMOUNT | InheritedMountFlags(program_directory);
    if (limits.read_only_mount) setup.program_remount_flags |= MS_RDONLY;
    setup.tmp_target = root + "/tmp";
    setup.work_directory = options.mount_point;

    for (const auto& path : options.system_paths) {
        std::error_code ec;
        fs::file_status status = fs::symlink_status(path, ec);
        if (ec) continue;
        SystemMount mount;
        mount.source = path;
        mount.target = root + path;
        if (fs::is_symlink(status)) {
            mount.link_target = fs::read_symlink(path, ec).string();
            if (ec || mount.link_target.empty()) continue;
            setup.system_mounts.push_back(std::move(mount));
        } else if (fs::is_directory(status)) {
            mount.remount_flags = MS_BIND | MS_REMOUNT | MS_RDONLY | InheritedMountFlags(path);
            setup.system_mounts.push_back(std::move(mount));
            for (const auto& submount : MountPointsUnder(path)) {
                SystemMount remount;
                remount.target = root + submount;
                remount.remount_flags = MS_BIND | MS_REMOUNT | MS_RDONLY | InheritedMountFlags(submount);
                remount.remount_only = true;
                setup.system_mounts.push_back(std::move(remount));
            }
        }
    }

    snprintf(setup.uid_map, sizeof(setup.uid_map), "%u %u 1\n", getuid(), getuid());
    snprintf(setup.gid_map, sizeof(setup.gid_map), "%u %u 1\n", getgid(), getgid());
    setup.limits = limits;
    return setup;
}

// Recursive, because a plain bind of a tree with locked submounts is refused
// inside a user namespace.
bool BindMount(const char* source, const char* target, unsigned long remount_flags) {
    if (mkdir(target, 0755) == -1 && errno != EEXIST) return false;
    if (mount(source, target, nullptr, MS_BIND | MS_REC, nullptr) == -1) return false;
    return mount(nullptr, target, nullptr, remount_flags, nullptr) == 0;
}

// Builds a tmpfs root holding read-only system directories, the program
// directory and an empty /tmp, then pivots into it and drops the host root.
const char* EnterPrivateRoot(const SandboxSetup& setup) {
    const char* root = setup.root.c_str();
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == -1) return "make mounts private";
    if (mount("tmpfs", root, "tmpfs", MS_NOSUID | MS_NODEV, "size=1m,mode=0755") == -1) return "mount sandbox root";

    for (const auto& system : setup.system_mounts) {
        if (system.remount_only) {
            if (mount(nullptr, system.target.c_str(), nullptr, system.remount_flags, nullptr) == -1) {
                return "remount system submount read-only";
            }
        } else if (!system.link_target.empty()) {
            if (symlink(system.link_target.c_str(), system.target.c_str()) == -1) return "link system path";
        } else if (!BindMount(system.source.c_str(), system.target.c_str(), system.remount_flags)) {
            return "bind system path";
        }
    }
    if (!BindMount(setup.program_source.c_str(), setup.program_target.c_str(), setup.program_remount_flags)) {
        return "bind program directory";
    }
    if (mkdir(setup.tmp_target.c_str(), 01777) == -1) return "create /tmp";
    if (mount("tmpfs", setup.tmp_target.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, "size=16m,mode=1777") == -1) {
        return "mount /tmp";
    }
    if (mount(nullptr, root, nullptr, MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr) == -1) {
        return "remount sandbox root read-only";
    }

    if (chdir(root) == -1) return "chdir to sandbox root";
    if (syscall(SYS_pivot_root, ".", ".") == -1) return "pivot_root";
    if (umount2(".", MNT_DETACH) == -1) return "detach host root";
    if (chdir(setup.work_directory.c_str()) == -1) return "chdir";
    return nullptr;
}

// The intermediate child stays outside the new pid namespace and mirrors the
// exit status of the program, which runs as its pid 1. When pid 1 exits the
// kernel kills everything else in the namespace, setsid() or not.
[[noreturn]] void SuperviseNamespaceInit(pid_t init) {
    close(STDIN_FILENO);
    close(STDOUT_FILENO);
    close(STDERR_FILENO);
    int status = 0;
    while (waitpid(init, &status, 0) == -1) {
        if (errno != EINTR) _exit(kSupervisorFailedExitCode);
    }
    if (WIFEXITED(status)) _exit(WEXITSTATUS(status));
    _exit(128 + WTERMSIG(status));
}

// Runs in the forked child. Returns the failed step or nullptr.
const char* EnterSandbox(const SandboxSetup& setup) {
    int namespaces = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWPID;
    if (setup.limits.network_disabled) namespaces |= CLONE_NEWNET;
    if (unshare(namespaces) == -1) return "unshare";
    if (!WriteProcFile("/proc/self/setgroups", "deny")) return "write setgroups";
    if (!WriteProcFile("/proc/self/uid_map", setup.uid_map)) return "write uid_map";
    if (!WriteProcFile("/proc/self/gid_map", setup.gid_map)) return "write gid_map";

    const char* failed = EnterPrivateRoot(setup);
    if (failed) return failed;

    if (!SetLimit(RLIMIT_AS, setup.limits.memory_bytes)) return "setrlimit(RLIMIT_AS)";
    if (!SetLimit(RLIMIT_CPU, setup.limits.cpu_time_seconds)) return "setrlimit(RLIMIT_CPU)";
    if (!SetLimit(RLIMIT_NPROC, setup.limits.max_processes)) return "setrlimit(RLIMIT_NPROC)";
    if (!SetLimit(RLIMIT_FSIZE, 0)) return "setrlimit(RLIMIT_FSIZE)";
    if (!SetLimit(RLIMIT_CORE, 0)) return "setrlimit(RLIMIT_CORE)";

    if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) return "prctl(PR_SET_PDEATHSIG)";
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) return "prctl(PR_SET_NO_NEW_PRIVS)";
    // Empty the bounding set so nothing regains capabilities across exec.
    for (int cap = 0; cap <= CAP_LAST_CAP; ++cap) {
        if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) == -1 && errno != EINVAL) return "prctl(PR_CAPBSET_DROP)";
    }

    pid_t init = fork();
    if (init == -1) return "fork namespace init";
    if (init > 0) SuperviseNamespaceInit(init);
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) return "prctl(PR_SET_PDEATHSIG)";
    return nullptr;
}

// Holds the mount point of the sandbox root for the duration of one run.
class RootDirectory {
public:
    RootDirectory() : path_(Process::CreateTempDirectory()) {}
    ~RootDirectory() {
        if (!path_.empty()) Process::RemoveDirectory(path_);
    }

    RootDirectory(const RootDirectory&) = delete;
    RootDirectory& operator=(const RootDirectory&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

NamespaceBackend::NamespaceBackend(NamespaceBackendOptions options)
    : options_(std::move(options)), random_(std::random_device{}()) {}

ProcessOptions NamespaceBackend::MakeProcessOptions(const ResourceLimits& limits,
                                                    const std::string& program_directory,
                                                    const std::string& root) const {
    ProcessOptions options;
    SandboxSetup setup = MakeSetup(options_, limits, program_directory, root);
    options.child_setup = [setup]() { return EnterSandbox(setup); };
    return options;
}

std::vector<std::string> NamespaceBackend::InterpreterCommand(const std::string& entry_file) const {
    std::vector<std::string> argv = {options_.interpreter};
    argv.insert(argv.end(), options_.interpreter_flags.begin(), options_.interpreter_flags.end());
    argv.push_back(options_.mount_point + "/" + entry_file);
    return argv;
}

bool NamespaceBackend::Ping(std::string* error_message) {
    std::string directory = Process::CreateTempDirectory();
    if (directory.empty()) {
        if (error_message) *error_message = "cannot create health check directory";
        return false;
    }
    if (!Process::WriteFile(directory + "/check.py", "pass\n")) {
        Process::RemoveDirectory(directory);
        if (error_message) *error_message = "cannot write health check program";
        return false;
    }

    ProcessResult result;
    {
        RootDirectory root;
        ProcessOptions process_options = MakeProcessOptions(ResourceLimits{}, directory, root.path());
        process_options.timeout = kPingTimeout;
        result = Process::Run(InterpreterCommand("check.py"), process_options);
    }
    Process::RemoveDirectory(directory);

    if (!result.Succeeded()) {
        if (error_message) {
            *error_message = result.started ? "health check exited with code " + std::to_string(result.exit_code) + ": " + result.output
                                            : result.error_message;
        }
        return false;
    }
    return true;
}

std::string NamespaceBackend::NextHandle() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    ss << "ns-" << std::hex << std::setw(16) << std::setfill('0') << random_();
    return ss.str();
}

std::shared_ptr<NamespaceBackend::Environment> NamespaceBackend::Find(const std::string& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = environments_.find(handle);
    if (it == environments_.end()) return nullptr;
    return it->second;
}

ProvisionResult NamespaceBackend::Provision(const ResourceLimits& limits, const ProgramMount& program) {
    ProvisionResult provision;
    auto environment = std::make_shared<Environment>();
    environment->limits = limits;
    environment->program = program;

    provision.handle = NextHandle();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        environments_[provision.handle] = environment;
    }
    provision.success = true;
    Logger::Debug("Provisioned namespace sandbox ", provision.handle, " for ", program.host_directory);
    return provision;
}

RunResult NamespaceBackend::Run(const std::string& handle,
                                const std::optional<std::string>& input,
                                std::chrono::milliseconds timeout) {
    RunResult run;
    std::shared_ptr<Environment> environment = Find(handle);
    if (!environment) {
        run.error = IsolationError::kRuntimeFault;
        run.error_message = "unknown sandbox " + handle;
        return run;
    }

    RootDirectory root;
    if (root.path().empty()) {
        run.error = IsolationError::kRuntimeFault;
        run.error_message = "cannot create sandbox root";
        return run;
    }
    ProcessOptions process_options =
        MakeProcessOptions(environment->limits, environment->program.host_directory, root.path());
    process_options.stdin_data = input;
    process_options.timeout = timeout;
    process_options.on_spawn = [this, environment](pid_t pid) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (environment->destroyed) {
            kill(-pid, SIGKILL);
        } else {
            environment->pid = pid;
        }
    };

    ProcessResult result = Process::Run(InterpreterCommand(environment->program.entry_file), process_options);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        environment->pid = 0;
        environment->output = result.output;
    }
    run.output = result.output;

    if (result.timed_out) {
        run.error = IsolationError::kTimeout;
        run.error_message = "timed out after " + std::to_string(timeout.count()) + "ms";
        return run;
    }
    if (!result.started) {
        run.error = IsolationError::kRuntimeFault;
        run.error_message = result.error_message;
        return run;
    }
    run.success = true;
    run.exit_status = result.term_signal != 0 ? 128 + result.term_signal : result.exit_code;
    return run;
}

std::optional<std::string> NamespaceBackend::FetchOutput(const std::string& handle) {
    std::shared_ptr<Environment> environment = Find(handle);
    if (!environment) return std::nullopt;
    std::lock_guard<std::mutex> lock(mutex_);
    return environment->output;
}

DestroyResult NamespaceBackend::Destroy(const std::string& handle) {
    DestroyResult destroy;
    destroy.success = true;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = environments_.find(handle);
    if (it == environments_.end()) {
        destroy.already_gone = true;
        return destroy;
    }
    Environment& environment = *it->second;
    environment.destroyed = true;
    if (environment.pid > 0 && kill(-environment.pid, SIGKILL) == -1 && errno != ESRCH) {
        destroy.success = false;
        destroy.error_message = std::string("kill: ") + strerror(errno);
        return destroy;
    }
    environments_.erase(it);
    return destroy;
}

} // namespace evalbox
