#include <fmt/core.h>
#include <algorithm>
#include "checker/builtin.hpp"

namespace grader::checkers {
using namespace std;

string unordered_checker::name() const {
    return "unordered";
}

string unordered_checker::tolerance_policy() const {
    return "all whitespace separated tokens are compared as a multiset, order and line layout are ignored; non-zero exit code fails";
}

check_result unordered_checker::check(const string &, const string &expected, const string &actual) const {
    vector<string> expected_tokens = split_tokens(expected);
    vector<string> actual_tokens = split_tokens(actual);

    if (expected_tokens.size() != actual_tokens.size())
        return check_result::reject(fmt::format("Token count mismatch: expected {} tokens, got {}", expected_tokens.size(), actual_tokens.size()));

    sort(expected_tokens.begin(), expected_tokens.end());
    sort(actual_tokens.begin(), actual_tokens.end());
    if (expected_tokens != actual_tokens)
        return check_result::reject("Token multiset differs");
    return check_result::accept();
}

}  // namespace grader::checkers
