#include <fmt/core.h>
#include <cmath>
#include <cstdlib>
#include <boost/algorithm/string.hpp>
#include "checker/builtin.hpp"

namespace grader::checkers {
using namespace std;

/**
 * @brief 将一行解析为浮点数列表
 * @return 只要有一个 token 不能被完整解析为数字就返回 false
 */
static bool parse_numbers(const string &line, vector<double> &numbers) {
    numbers.clear();
    for (auto &token : split_tokens(line)) {
        char *end = nullptr;
        double value = strtod(token.c_str(), &end);
        if (end != token.c_str() + token.size())
            return false;
        numbers.push_back(value);
    }
    return true;
}

static bool is_close(double a, double b, double rel_tol, double abs_tol) {
    if (a == b) return true;  // 包括两个相同的无穷大
    if (isinf(a) || isinf(b)) return false;
    double diff = fabs(a - b);
    return diff <= max(rel_tol * max(fabs(a), fabs(b)), abs_tol);
}

string float_checker::name() const {
    return "float";
}

string float_checker::tolerance_policy() const {
    return fmt::format("line by line; when both lines are numbers of the same count they are compared with relative tolerance {} and absolute tolerance {}, otherwise lines are compared exactly after trimming; non-zero exit code fails", rel_tol, abs_tol);
}

check_result float_checker::check(const string &, const string &expected, const string &actual) const {
    vector<string> expected_lines = split_lines(normalize_output(expected));
    vector<string> actual_lines = split_lines(normalize_output(actual));

    if (expected_lines.size() != actual_lines.size())
        return check_result::reject(fmt::format("Line count mismatch: expected {} lines, got {}", expected_lines.size(), actual_lines.size()));

    vector<double> expected_numbers, actual_numbers;
    for (size_t i = 0; i < expected_lines.size(); ++i) {
        string exp_line = boost::trim_copy(expected_lines[i]);
        string act_line = boost::trim_copy(actual_lines[i]);

        if (parse_numbers(exp_line, expected_numbers) &&
            parse_numbers(act_line, actual_numbers) &&
            expected_numbers.size() == actual_numbers.size()) {
            for (size_t j = 0; j < expected_numbers.size(); ++j)
                if (!is_close(expected_numbers[j], actual_numbers[j], rel_tol, abs_tol))
                    return check_result::reject(fmt::format("Line {}, token {}: value out of tolerance", i + 1, j + 1));
        } else if (exp_line != act_line) {
            return check_result::reject(fmt::format("Line {} differs", i + 1));
        }
    }
    return check_result::accept();
}

}  // namespace grader::checkers
