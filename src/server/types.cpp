#include "src/server/types.h"

#include <algorithm>

namespace evalbox {

ExecutionOutcome ExecutionOutcome::Succeeded(std::string output, int exit_code, std::chrono::milliseconds elapsed) {
    ExecutionOutcome outcome;
    outcome.success = true;
    outcome.output = std::move(output);
    outcome.exit_code = exit_code;
    outcome.execution_time = elapsed;
    return outcome;
}

ExecutionOutcome ExecutionOutcome::Failed(std::string error, std::optional<std::string> output,
                                          std::chrono::milliseconds elapsed) {
    ExecutionOutcome outcome;
    outcome.success = false;
    outcome.error = error.empty() ? std::string("execution failed") : std::move(error);
    outcome.output = std::move(output);
    outcome.execution_time = elapsed;
    return outcome;
}

ExecutionOutcome ExecutionOutcome::Unavailable() {
    return Failed("execution unavailable", std::nullopt, std::chrono::milliseconds(0));
}

SuiteResult SuiteResult::FromResults(std::vector<TestCaseResult> results) {
    SuiteResult suite;
    suite.total_count = results.size();
    suite.passed_count = static_cast<size_t>(
        std::count_if(results.begin(), results.end(), [](const TestCaseResult& r) { return r.passed; }));
    suite.passed = suite.passed_count == suite.total_count;
    suite.results = std::move(results);
    return suite;
}

} // namespace evalbox
