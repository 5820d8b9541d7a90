#pragma once

#include "proto/evalbox.pb.h"
#include "src/server/types.h"

#include <chrono>
#include <string>
#include <vector>

namespace evalbox {

struct SuiteRequest {
    std::string code;
    std::vector<TestCase> test_cases;
};

// Request decoding. On failure *error says what the caller got wrong.
// Timeout overrides must be positive and shorter than max_timeout.
bool FromProto(const rpc::ExecuteRequest& proto, std::chrono::seconds max_timeout,
               ExecutionRequest* request, std::string* error);
bool FromProto(const rpc::RunSuiteRequest& proto, SuiteRequest* request, std::string* error);

void ToProto(const ExecutionOutcome& outcome, rpc::ExecutionOutcome* proto);

// Hidden test cases keep their verdict and error, but not their input,
// expected answer or output.
void ToProto(const SuiteResult& suite, rpc::SuiteResult* proto);

} // namespace evalbox
