#include <fmt/core.h>
#include "checker/builtin.hpp"

namespace grader::checkers {
using namespace std;

string exact_checker::name() const {
    return "exact";
}

string exact_checker::tolerance_policy() const {
    return "trailing whitespace per line and trailing blank lines are ignored, CRLF equals LF, everything else must match byte by byte; non-zero exit code fails";
}

check_result exact_checker::check(const string &, const string &expected, const string &actual) const {
    vector<string> expected_lines = split_lines(normalize_output(expected));
    vector<string> actual_lines = split_lines(normalize_output(actual));

    size_t common = min(expected_lines.size(), actual_lines.size());
    for (size_t i = 0; i < common; ++i)
        if (expected_lines[i] != actual_lines[i])
            return check_result::reject(fmt::format("Line {} differs", i + 1));

    if (actual_lines.size() > expected_lines.size())
        return check_result::reject(fmt::format("Unexpected extra output starting at line {}", common + 1));
    if (actual_lines.size() < expected_lines.size())
        return check_result::reject(fmt::format("Output ended early after {} lines", actual_lines.size()));
    return check_result::accept();
}

string exact_ignore_exitcode_checker::name() const {
    return "exact-ignore-exitcode";
}

string exact_ignore_exitcode_checker::tolerance_policy() const {
    return "same comparison as exact; a non-zero exit code does not fail the test case on its own";
}

bool exact_ignore_exitcode_checker::ignores_exit_code() const {
    return true;
}

}  // namespace grader::checkers
