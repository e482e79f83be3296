#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include "checker/builtin.hpp"

namespace grader::checkers {
using namespace std;

/**
 * @brief 计算若干闭区间覆盖的不同整数个数
 */
static long long count_covered(vector<pair<long long, long long>> intervals) {
    if (intervals.empty()) return 0;
    sort(intervals.begin(), intervals.end());

    long long total = 0;
    auto [start, end] = intervals[0];
    for (size_t i = 1; i < intervals.size(); ++i) {
        if (intervals[i].first <= end + 1) {
            end = max(end, intervals[i].second);
        } else {
            total += end - start + 1;
            start = intervals[i].first;
            end = intervals[i].second;
        }
    }
    return total + end - start + 1;
}

string kolekcija_checker::name() const {
    return "kolekcija";
}

string kolekcija_checker::tolerance_policy() const {
    return "first line must equal the optimal number of disk reads; any assignment of length-K intervals inside [1, N] that covers each song and reads exactly the claimed number of songs is accepted; non-zero exit code fails";
}

check_result kolekcija_checker::check(const string &input, const string &expected, const string &actual) const {
    vector<string> input_lines = split_lines(normalize_output(input));
    vector<string> expected_lines = split_lines(normalize_output(expected));
    vector<string> actual_lines = split_lines(normalize_output(actual));

    vector<string> header = split_tokens(input_lines.at(0));
    long long n = boost::lexical_cast<long long>(header.at(0));
    long long k = boost::lexical_cast<long long>(header.at(1));
    long long m = boost::lexical_cast<long long>(boost::trim_copy(input_lines.at(1)));

    vector<long long> songs;
    for (long long i = 0; i < m; ++i)
        songs.push_back(boost::lexical_cast<long long>(boost::trim_copy(input_lines.at(2 + i))));

    long long expected_reads = boost::lexical_cast<long long>(boost::trim_copy(expected_lines.at(0)));

    if (actual_lines.empty())
        return check_result::reject("No output");

    long long claimed;
    try {
        claimed = boost::lexical_cast<long long>(boost::trim_copy(actual_lines[0]));
    } catch (boost::bad_lexical_cast &) {
        return check_result::reject("Line 1: number of disk reads is not an integer");
    }

    if (claimed != expected_reads)
        return check_result::reject("Number of disk reads is not optimal");

    if ((long long) actual_lines.size() < m + 1)
        return check_result::reject(fmt::format("Expected {} intervals, got {}", m, actual_lines.size() - 1));

    vector<pair<long long, long long>> intervals;
    for (long long i = 0; i < m; ++i) {
        vector<string> parts = split_tokens(actual_lines[i + 1]);
        if (parts.size() != 2)
            return check_result::reject(fmt::format("Invalid interval format on line {}", i + 2));
        long long a, b;
        try {
            a = boost::lexical_cast<long long>(parts[0]);
            b = boost::lexical_cast<long long>(parts[1]);
        } catch (boost::bad_lexical_cast &) {
            return check_result::reject(fmt::format("Invalid interval on line {}", i + 2));
        }

        // 先检查边界，之后 b - a + 1 不会溢出
        if (a < 1 || b > n || a > b)
            return check_result::reject(fmt::format("Interval {} [{}, {}] out of bounds [1, {}]", i + 1, a, b, n));
        if (b - a + 1 != k)
            return check_result::reject(fmt::format("Interval {} has length {}, expected {}", i + 1, b - a + 1, k));
        if (songs[i] < a || songs[i] > b)
            return check_result::reject(fmt::format("Interval {} does not contain its song", i + 1));
        intervals.emplace_back(a, b);
    }

    long long reads = count_covered(intervals);
    if (reads != claimed)
        return check_result::reject(fmt::format("Intervals read {} songs, claimed {}", reads, claimed));

    return check_result::accept();
}

}  // namespace grader::checkers
