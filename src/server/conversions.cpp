#include "src/server/conversions.h"

namespace evalbox {

namespace {

bool CheckCommon(const std::string& code, const std::string& language, std::string* error) {
    if (!language.empty() && language != "python") {
        *error = "unsupported language '" + language + "'; only python is supported";
        return false;
    }
    if (code.empty()) {
        *error = "code must not be empty";
        return false;
    }
    return true;
}

double ToSeconds(std::chrono::milliseconds duration) {
    return std::chrono::duration<double>(duration).count();
}

} // namespace

bool FromProto(const rpc::ExecuteRequest& proto, std::chrono::seconds max_timeout,
               ExecutionRequest* request, std::string* error) {
    if (!CheckCommon(proto.code(), proto.language(), error)) return false;
    if (proto.has_timeout_seconds()) {
        std::chrono::seconds timeout(proto.timeout_seconds());
        if (timeout.count() == 0 || timeout >= max_timeout) {
            *error = "timeout_seconds must be between 1 and " + std::to_string(max_timeout.count() - 1);
            return false;
        }
        request->timeout = timeout;
    }
    request->code = proto.code();
    if (proto.has_input()) request->input = proto.input();
    return true;
}

bool FromProto(const rpc::RunSuiteRequest& proto, SuiteRequest* request, std::string* error) {
    if (!CheckCommon(proto.code(), proto.language(), error)) return false;
    request->code = proto.code();
    request->test_cases.clear();
    for (int i = 0; i < proto.test_cases_size(); ++i) {
        const rpc::TestCase& test_case = proto.test_cases(i);
        if (!test_case.has_expected_output()) {
            *error = "test case " + std::to_string(i + 1) + " has no expected_output";
            return false;
        }
        TestCase converted;
        converted.input = test_case.input();
        converted.expected_output = test_case.expected_output();
        converted.description = test_case.description();
        converted.hidden = test_case.hidden();
        request->test_cases.push_back(std::move(converted));
    }
    return true;
}

void ToProto(const ExecutionOutcome& outcome, rpc::ExecutionOutcome* proto) {
    proto->set_success(outcome.success);
    if (outcome.output) proto->set_output(*outcome.output);
    if (outcome.error) proto->set_error(*outcome.error);
    proto->set_execution_time_seconds(ToSeconds(outcome.execution_time));
    if (outcome.exit_code) proto->set_exit_code(*outcome.exit_code);
    proto->set_timed_out(outcome.timed_out);
}

void ToProto(const SuiteResult& suite, rpc::SuiteResult* proto) {
    proto->set_success(suite.passed);
    proto->set_total_tests(static_cast<uint32_t>(suite.total_count));
    proto->set_passed_tests(static_cast<uint32_t>(suite.passed_count));
    for (const TestCaseResult& result : suite.results) {
        rpc::TestCaseResult* out = proto->add_test_results();
        out->set_test_case(static_cast<uint32_t>(result.index));
        out->set_passed(result.passed);
        out->set_execution_time_seconds(ToSeconds(result.execution_time));
        out->set_hidden(result.hidden);
        if (result.error) out->set_error(*result.error);
        if (result.hidden) continue;

        out->set_input(result.input);
        out->set_expected(result.expected);
        if (result.actual) out->set_actual(*result.actual);
        if (result.output) out->set_output(*result.output);
    }
}

} // namespace evalbox
