#include "src/server/suite_runner.h"
#include "src/server/logger.h"

namespace evalbox {

std::string TrimWhitespace(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

SuiteRunner::SuiteRunner(Sandbox& sandbox, HarnessGenerator harness)
    : sandbox_(sandbox), harness_(std::move(harness)) {}

SuiteResult SuiteRunner::RunSuite(const std::string& code, const std::vector<TestCase>& test_cases) {
    std::vector<TestCaseResult> results;
    results.reserve(test_cases.size());
    for (size_t i = 0; i < test_cases.size(); ++i) {
        results.push_back(RunTestCase(i + 1, code, test_cases[i]));
    }

    SuiteResult suite = SuiteResult::FromResults(std::move(results));
    Logger::Info("Suite finished: ", suite.passed_count, "/", suite.total_count, " test(s) passed");
    return suite;
}

TestCaseResult SuiteRunner::RunTestCase(size_t index, const std::string& code, const TestCase& test_case) {
    ExecutionRequest request;
    request.code = harness_.Wrap(code, test_case);
    ExecutionOutcome outcome = sandbox_.Execute(request);

    TestCaseResult result;
    result.index = index;
    result.input = test_case.input;
    result.expected = TrimWhitespace(test_case.expected_output);
    result.execution_time = outcome.execution_time;
    result.hidden = test_case.hidden;

    if (!outcome.success) {
        result.passed = false;
        result.error = outcome.error;
        result.output = outcome.output;
        Logger::Info("Test case ", index, " failed to run: ", outcome.error.value_or(""));
        return result;
    }

    result.actual = TrimWhitespace(outcome.output.value_or(""));
    result.passed = *result.actual == result.expected;
    Logger::Debug("Test case ", index, (result.passed ? " passed" : " produced a wrong answer"));
    return result;
}

} // namespace evalbox
