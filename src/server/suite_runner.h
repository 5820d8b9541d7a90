#pragma once

#include "src/server/harness.h"
#include "src/server/sandbox.h"
#include "src/server/types.h"

#include <string>
#include <vector>

namespace evalbox {

// Python-style strip of ASCII whitespace.
std::string TrimWhitespace(const std::string& text);

class SuiteRunner {
public:
    SuiteRunner(Sandbox& sandbox, HarnessGenerator harness);

    // Runs every test case in order, each in its own environment. A failing
    // case never stops the ones after it.
    SuiteResult RunSuite(const std::string& code, const std::vector<TestCase>& test_cases);

private:
    TestCaseResult RunTestCase(size_t index, const std::string& code, const TestCase& test_case);

    Sandbox& sandbox_;
    HarnessGenerator harness_;
};

} // namespace evalbox
