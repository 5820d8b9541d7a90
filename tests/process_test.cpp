#include "src/server/process.h"

#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sys/resource.h>
#include <unistd.h>

namespace evalbox {
namespace {

ProcessResult Shell(const std::string& script, ProcessOptions options = {}) {
    return Process::Run({"/bin/sh", "-c", script}, options);
}

TEST(ProcessTest, CapturesStdoutAndStderrTogether) {
    ProcessResult result = Shell("echo out; echo err 1>&2");

    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.output, "out\nerr\n");
}

TEST(ProcessTest, ReportsExitCode) {
    ProcessResult result = Shell("exit 7");

    EXPECT_TRUE(result.started);
    EXPECT_FALSE(result.Succeeded());
    EXPECT_EQ(result.exit_code, 7);
    EXPECT_EQ(result.term_signal, 0);
}

TEST(ProcessTest, ReportsTerminatingSignal) {
    ProcessResult result = Shell("kill -TERM $$");

    EXPECT_TRUE(result.started);
    EXPECT_EQ(result.term_signal, SIGTERM);
    EXPECT_EQ(result.exit_code, -1);
}

TEST(ProcessTest, FeedsStdin) {
    ProcessOptions options;
    options.stdin_data = "hello\nworld\n";

    ProcessResult result = Process::Run({"cat"}, options);

    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.output, "hello\nworld\n");
}

TEST(ProcessTest, LargeStdinDoesNotDeadlock) {
    ProcessOptions options;
    options.stdin_data = std::string(1 << 20, 'x');
    options.timeout = std::chrono::seconds(10);

    ProcessResult result = Process::Run({"wc", "-c"}, options);

    EXPECT_TRUE(result.Succeeded());
    EXPECT_NE(result.output.find("1048576"), std::string::npos) << result.output;
}

TEST(ProcessTest, MissingStdinReadsEof) {
    ProcessOptions options;
    options.timeout = std::chrono::seconds(5);

    ProcessResult result = Process::Run({"cat"}, options);

    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.output, "");
}

TEST(ProcessTest, DeadlineKillsTheProcess) {
    ProcessOptions options;
    options.timeout = std::chrono::milliseconds(200);

    ProcessResult result = Shell("echo started; sleep 30", options);

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.Succeeded());
    EXPECT_EQ(result.output, "started\n");
    EXPECT_LT(result.elapsed, std::chrono::seconds(5));
}

TEST(ProcessTest, DeadlineKillsTheWholeProcessGroup) {
    ProcessOptions options;
    options.timeout = std::chrono::milliseconds(200);

    // The background sleep keeps the output pipe open unless it dies too.
    ProcessResult result = Shell("sleep 30 & sleep 30; wait", options);

    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(result.elapsed, std::chrono::seconds(2));
}

TEST(ProcessTest, MissingBinaryIsNotStarted) {
    ProcessResult result = Process::Run({"/nonexistent/evalbox-binary"});

    EXPECT_FALSE(result.started);
    EXPECT_NE(result.error_message.find("exec"), std::string::npos) << result.error_message;
}

TEST(ProcessTest, ChildSetupFailureIsReported) {
    ProcessOptions options;
    options.child_setup = []() -> const char* {
        errno = EPERM;
        return "enter sandbox";
    };

    ProcessResult result = Shell("echo should-not-run", options);

    EXPECT_FALSE(result.started);
    EXPECT_NE(result.error_message.find("enter sandbox"), std::string::npos) << result.error_message;
    EXPECT_EQ(result.output, "");
}

TEST(ProcessTest, OnSpawnSeesTheChildPid) {
    pid_t seen = 0;
    ProcessOptions options;
    options.on_spawn = [&seen](pid_t pid) { seen = pid; };

    ProcessResult result = Shell("true", options);

    EXPECT_TRUE(result.Succeeded());
    EXPECT_GT(seen, 0);
}

TEST(ProcessTest, OutputBeyondLimitIsDropped) {
    ProcessOptions options;
    options.max_output_bytes = 10;
    options.timeout = std::chrono::seconds(5);

    ProcessResult result = Process::Run({"head", "-c", "100000", "/dev/zero"}, options);

    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.output.size(), 10u);
    EXPECT_TRUE(result.output_truncated);
}

TEST(ProcessTest, WorksWithDescriptorsAboveFdSetsize) {
    constexpr int kFirstFreeDescriptor = 1100;
    rlimit limit;
    ASSERT_EQ(getrlimit(RLIMIT_NOFILE, &limit), 0);
    rlimit saved = limit;
    if (limit.rlim_cur < kFirstFreeDescriptor + 16) {
        if (limit.rlim_max != RLIM_INFINITY && limit.rlim_max < kFirstFreeDescriptor + 16) {
            GTEST_SKIP() << "RLIMIT_NOFILE hard limit is " << limit.rlim_max;
        }
        limit.rlim_cur = kFirstFreeDescriptor + 16;
        ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &limit), 0);
    }

    // Occupy every low descriptor so the runner's pipes land past 1024.
    std::vector<int> fillers;
    int fd;
    while ((fd = open("/dev/null", O_RDONLY | O_CLOEXEC)) >= 0 && fd < kFirstFreeDescriptor) {
        fillers.push_back(fd);
    }
    if (fd >= 0) fillers.push_back(fd);

    ProcessOptions options;
    options.stdin_data = "above the limit\n";
    options.timeout = std::chrono::seconds(5);
    ProcessResult result = Process::Run({"cat"}, options);

    for (int filler : fillers) close(filler);
    setrlimit(RLIMIT_NOFILE, &saved);

    EXPECT_TRUE(result.Succeeded()) << result.error_message;
    EXPECT_EQ(result.output, "above the limit\n");
}

TEST(ProcessTest, TempDirectoryLifecycle) {
    std::string directory = Process::CreateTempDirectory();
    ASSERT_FALSE(directory.empty());
    ASSERT_TRUE(Process::WriteFile(directory + "/main.py", "print(1)\n"));

    std::ifstream in(directory + "/main.py");
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "print(1)");

    EXPECT_TRUE(Process::RemoveDirectory(directory));
    EXPECT_FALSE(std::filesystem::exists(directory));
    EXPECT_FALSE(Process::RemoveDirectory(directory));
}

} // namespace
} // namespace evalbox
