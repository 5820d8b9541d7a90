#include "src/server/harness.h"

namespace evalbox {

namespace {

constexpr char kHarnessTemplate[] = R"PY(import json
import sys
import traceback

_SOURCE = @SOURCE@.decode("utf-8", "replace")
_INPUT = @INPUT@.decode("utf-8", "replace")
_ENTRY_POINT = @ENTRY_POINT@.decode("utf-8")

_namespace = {"__name__": "__solution__", "__builtins__": __builtins__}
try:
    exec(compile(_SOURCE, "<solution>", "exec"), _namespace)
except Exception:
    traceback.print_exc()
    sys.exit(@USER_EXCEPTION_EXIT@)

_entry = _namespace.get(_ENTRY_POINT)
if not callable(_entry):
    print("Error: function '%s' is not defined" % _ENTRY_POINT, file=sys.stderr)
    sys.exit(@MISSING_ENTRY_POINT_EXIT@)

try:
    _parsed = json.loads(_INPUT)
except (ValueError, RecursionError):
    _parsed = _INPUT

try:
    if isinstance(_parsed, list):
        _result = _entry(*_parsed)
    else:
        _result = _entry(_parsed)
except Exception as _error:
    print("Error: %s" % (_error,), file=sys.stderr)
    traceback.print_exc()
    sys.exit(@USER_EXCEPTION_EXIT@)

if isinstance(_result, bool):
    _result = str(_result).lower()
print(_result)
)PY";

} // namespace

HarnessGenerator::HarnessGenerator(std::string entry_point) : entry_point_(std::move(entry_point)) {}

std::string HarnessGenerator::Wrap(const std::string& user_code, const TestCase& test_case) const {
    return RenderTemplate(kHarnessTemplate, {
        {"SOURCE", PythonBytesLiteral(user_code)},
        {"INPUT", PythonBytesLiteral(test_case.input)},
        {"ENTRY_POINT", PythonBytesLiteral(entry_point_)},
        {"USER_EXCEPTION_EXIT", std::to_string(kUserExceptionExitCode)},
        {"MISSING_ENTRY_POINT_EXIT", std::to_string(kMissingEntryPointExitCode)},
    });
}

std::string HarnessGenerator::PythonBytesLiteral(const std::string& data) {
    static const char kHex[] = "0123456789abcdef";
    std::string literal = "b\"";
    literal.reserve(data.size() + 3);
    for (unsigned char c : data) {
        switch (c) {
            case '\\': literal += "\\\\"; break;
            case '"': literal += "\\\""; break;
            case '\n': literal += "\\n"; break;
            case '\r': literal += "\\r"; break;
            case '\t': literal += "\\t"; break;
            default:
                if (c >= 0x20 && c < 0x7f) {
                    literal += static_cast<char>(c);
                } else {
                    literal += "\\x";
                    literal += kHex[c >> 4];
                    literal += kHex[c & 0x0f];
                }
        }
    }
    literal += '"';
    return literal;
}

std::string HarnessGenerator::RenderTemplate(const std::string& text,
                                             const std::map<std::string, std::string>& values) {
    std::string rendered;
    rendered.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find('@', pos);
        if (open == std::string::npos) break;
        size_t close = text.find('@', open + 1);
        if (close == std::string::npos) break;

        auto it = values.find(text.substr(open + 1, close - open - 1));
        if (it == values.end()) {
            // Not a placeholder; keep the '@' and resume right after it.
            rendered.append(text, pos, open + 1 - pos);
            pos = open + 1;
            continue;
        }
        rendered.append(text, pos, open - pos);
        rendered += it->second;
        pos = close + 1;
    }
    rendered.append(text, pos, std::string::npos);
    return rendered;
}

} // namespace evalbox
