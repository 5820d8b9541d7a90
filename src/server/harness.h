#pragma once

#include "src/server/types.h"

#include <map>
#include <string>

namespace evalbox {

// Turns a submitted solution plus one test case into a standalone Python
// program that calls the solution's entry point with the test input and
// prints the result.
//
// The generated program:
//  - parses the input as JSON, falling back to the raw text;
//  - spreads a JSON array into positional arguments, otherwise passes the
//    value as the only argument;
//  - prints booleans as "true"/"false";
//  - exits with kUserExceptionExitCode after printing the traceback when the
//    solution raises (or fails to load), and with kMissingEntryPointExitCode
//    when the entry point is not defined.
//
// Source and input are embedded as escaped bytes literals, so no content can
// terminate the literal it lives in.
class HarnessGenerator {
public:
    static constexpr int kUserExceptionExitCode = 1;
    static constexpr int kMissingEntryPointExitCode = 2;

    explicit HarnessGenerator(std::string entry_point = "solution");

    std::string Wrap(const std::string& user_code, const TestCase& test_case) const;

    const std::string& entry_point() const { return entry_point_; }

    // b"..." literal holding exactly the given bytes.
    static std::string PythonBytesLiteral(const std::string& data);

    // Replaces each @NAME@ in a single left-to-right pass; substituted text is
    // never rescanned. Unknown names are left as they are.
    static std::string RenderTemplate(const std::string& text, const std::map<std::string, std::string>& values);

private:
    std::string entry_point_;
};

} // namespace evalbox
