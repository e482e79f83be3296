#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <array>
#include <cmath>
#include "checker/builtin.hpp"

namespace grader::checkers {
using namespace std;

static constexpr int CAKE_HALF_SIZE = 5000;

typedef array<long long, 4> cut;

static bool inside_cake(long long v) {
    return -CAKE_HALF_SIZE <= v && v <= CAKE_HALF_SIZE;
}

static bool on_boundary(long long x, long long y) {
    if (!inside_cake(x) || !inside_cake(y)) return false;
    return max(llabs(x), llabs(y)) == CAKE_HALF_SIZE;
}

/**
 * @brief 判断两刀所在直线的交点是否严格位于蛋糕内部
 */
static bool intersects_inside(const cut &a, const cut &b) {
    auto [x1, y1, x2, y2] = a;
    auto [x3, y3, x4, y4] = b;

    long long denom = (x1 - x2) * (y3 - y4) - (y1 - y2) * (x3 - x4);
    if (denom == 0) return false;  // 平行或重合

    double t = (double) ((x1 - x3) * (y3 - y4) - (y1 - y3) * (x3 - x4)) / denom;
    double px = x1 + t * (x2 - x1);
    double py = y1 + t * (y2 - y1);
    return -CAKE_HALF_SIZE < px && px < CAKE_HALF_SIZE && -CAKE_HALF_SIZE < py && py < CAKE_HALF_SIZE;
}

string rez_checker::name() const {
    return "rez";
}

string rez_checker::tolerance_policy() const {
    return "first line must equal the optimal number of cuts; any set of boundary-to-boundary cuts producing at least K pieces is accepted; non-zero exit code fails";
}

check_result rez_checker::check(const string &input, const string &expected, const string &actual) const {
    long long k = boost::lexical_cast<long long>(boost::trim_copy(input));
    vector<string> expected_lines = split_lines(normalize_output(expected));
    vector<string> actual_lines = split_lines(normalize_output(actual));

    long long expected_n = boost::lexical_cast<long long>(boost::trim_copy(expected_lines.at(0)));

    if (actual_lines.empty())
        return check_result::reject("No output");

    long long n;
    try {
        n = boost::lexical_cast<long long>(boost::trim_copy(actual_lines[0]));
    } catch (boost::bad_lexical_cast &) {
        return check_result::reject("Line 1: number of cuts is not an integer");
    }

    if (n != expected_n)
        return check_result::reject("Number of cuts is not optimal");

    if ((long long) actual_lines.size() < n + 1)
        return check_result::reject(fmt::format("Expected {} cuts, got {}", n, actual_lines.size() - 1));

    vector<cut> cuts;
    for (long long i = 1; i <= n; ++i) {
        vector<string> parts = split_tokens(actual_lines[i]);
        if (parts.size() != 4)
            return check_result::reject(fmt::format("Invalid cut format on line {}", i + 1));
        cut c;
        try {
            for (int j = 0; j < 4; ++j)
                c[j] = boost::lexical_cast<long long>(parts[j]);
        } catch (boost::bad_lexical_cast &) {
            return check_result::reject(fmt::format("Invalid cut on line {}", i + 1));
        }
        if (!on_boundary(c[0], c[1]) || !on_boundary(c[2], c[3]))
            return check_result::reject(fmt::format("Cut {} has an endpoint not on the boundary", i));
        cuts.push_back(c);
    }

    long long intersections = 0;
    for (size_t i = 0; i < cuts.size(); ++i)
        for (size_t j = i + 1; j < cuts.size(); ++j)
            if (intersects_inside(cuts[i], cuts[j]))
                ++intersections;

    long long pieces = 1 + n + intersections;
    if (pieces < k)
        return check_result::reject(fmt::format("Cuts create only {} pieces, need at least {}", pieces, k));

    return check_result::accept();
}

}  // namespace grader::checkers
