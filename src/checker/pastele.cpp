#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <unordered_map>
#include "checker/builtin.hpp"

namespace grader::checkers {
using namespace std;

static int encode_color(int r, int g, int b) {
    return (r << 16) | (g << 8) | b;
}

string pastele_checker::name() const {
    return "pastele";
}

string pastele_checker::tolerance_policy() const {
    return "first line must equal the optimal colorfulness; the next K lines are any multiset of crayons taken from the input whose colorfulness equals the claimed value; non-zero exit code fails";
}

check_result pastele_checker::check(const string &input, const string &expected, const string &actual) const {
    vector<string> input_lines = split_lines(normalize_output(input));
    vector<string> expected_lines = split_lines(normalize_output(expected));
    vector<string> actual_lines = split_lines(normalize_output(actual));

    vector<string> header = split_tokens(input_lines.at(0));
    int n = boost::lexical_cast<int>(header.at(0));
    int k = boost::lexical_cast<int>(header.at(1));

    // 蜡笔颜色 -> 输入中的数量
    unordered_map<int, int> available;
    for (int i = 1; i <= n; ++i) {
        vector<string> rgb = split_tokens(input_lines.at(i));
        available[encode_color(boost::lexical_cast<int>(rgb.at(0)), boost::lexical_cast<int>(rgb.at(1)), boost::lexical_cast<int>(rgb.at(2)))]++;
    }

    long long expected_colorfulness = boost::lexical_cast<long long>(boost::trim_copy(expected_lines.at(0)));

    if (actual_lines.empty())
        return check_result::reject("No output");

    long long claimed;
    try {
        claimed = boost::lexical_cast<long long>(boost::trim_copy(actual_lines[0]));
    } catch (boost::bad_lexical_cast &) {
        return check_result::reject("Line 1: colorfulness is not an integer");
    }

    if (claimed != expected_colorfulness)
        return check_result::reject("Colorfulness is not optimal");

    if ((int) actual_lines.size() < k + 1)
        return check_result::reject(fmt::format("Expected {} crayons, got {}", k, actual_lines.size() - 1));

    int min_r = 256, min_g = 256, min_b = 256;
    int max_r = -1, max_g = -1, max_b = -1;
    for (int i = 1; i <= k; ++i) {
        vector<string> parts = split_tokens(actual_lines[i]);
        if (parts.size() != 3)
            return check_result::reject(fmt::format("Invalid crayon format on line {}", i + 1));
        int r = boost::lexical_cast<int>(parts[0]);
        int g = boost::lexical_cast<int>(parts[1]);
        int b = boost::lexical_cast<int>(parts[2]);

        if (r < 0 || r > 255 || g < 0 || g > 255 || b < 0 || b > 255)
            return check_result::reject(fmt::format("Crayon on line {} is out of range", i + 1));

        auto it = available.find(encode_color(r, g, b));
        if (it == available.end() || it->second <= 0)
            return check_result::reject(fmt::format("Crayon on line {} is not available (not in input or already used)", i + 1));
        --it->second;

        min_r = min(min_r, r), max_r = max(max_r, r);
        min_g = min(min_g, g), max_g = max(max_g, g);
        min_b = min(min_b, b), max_b = max(max_b, b);
    }

    long long computed = max({max_r - min_r, max_g - min_g, max_b - min_b});
    if (computed != claimed)
        return check_result::reject(fmt::format("Computed colorfulness is {}, but claimed {}", computed, claimed));

    return check_result::accept();
}

}  // namespace grader::checkers
