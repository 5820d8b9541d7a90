#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace evalbox {

struct ExecutionRequest {
    std::string code;
    std::optional<std::string> input;
    std::optional<std::chrono::milliseconds> timeout;
};

// success implies no error; failure always carries one.
struct ExecutionOutcome {
    bool success = false;
    // Combined stdout and stderr. Unset when nothing could be retrieved.
    std::optional<std::string> output;
    std::optional<std::string> error;
    std::chrono::milliseconds execution_time{0};
    std::optional<int> exit_code;
    bool timed_out = false;

    static ExecutionOutcome Succeeded(std::string output, int exit_code, std::chrono::milliseconds elapsed);
    static ExecutionOutcome Failed(std::string error, std::optional<std::string> output,
                                   std::chrono::milliseconds elapsed);
    static ExecutionOutcome Unavailable();
};

struct TestCase {
    std::string input;
    std::string expected_output;
    std::string description;
    bool hidden = false;
};

struct TestCaseResult {
    // 1-based position in the suite.
    size_t index = 0;
    bool passed = false;
    std::string input;
    std::string expected;
    // Unset when the program failed before producing an answer.
    std::optional<std::string> actual;
    std::optional<std::string> error;
    // Whatever the program printed before failing.
    std::optional<std::string> output;
    std::chrono::milliseconds execution_time{0};
    bool hidden = false;
};

struct SuiteResult {
    bool passed = true;
    std::vector<TestCaseResult> results;
    size_t total_count = 0;
    size_t passed_count = 0;

    // Derives the counters and the overall flag from the results.
    static SuiteResult FromResults(std::vector<TestCaseResult> results);
};

} // namespace evalbox
