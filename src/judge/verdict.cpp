#include "judge/verdict.hpp"
#include <boost/rational.hpp>
#include <algorithm>
#include <cmath>

namespace grader {
using namespace std;
using namespace nlohmann;

int verdict::passed() const {
    return (int)count_if(tests.begin(), tests.end(), [](const test_outcome &t) {
        return t.status == test_status::PASSED;
    });
}

int verdict::total() const {
    return (int)tests.size();
}

verdict verdict::aggregate(vector<test_outcome> tests, optional<language> lang) {
    sort(tests.begin(), tests.end(), [](const test_outcome &a, const test_outcome &b) {
        return a.index < b.index;
    });

    verdict result;
    result.tests = move(tests);
    result.lang = lang;

    int passed = result.passed(), total = result.total();
    if (total == 0) {
        result.status = verdict_status::FAILED;
        result.score = 0;
        return result;
    }

    boost::rational<int> fraction(passed, total);
    result.score = boost::rational_cast<double>(fraction);
    if (passed == total)
        result.status = verdict_status::PASSED;
    else if (passed > 0)
        result.status = verdict_status::PARTIAL;
    else
        result.status = verdict_status::FAILED;
    return result;
}

verdict verdict::compile_error(const string &diagnostic, optional<language> lang) {
    verdict result;
    result.status = verdict_status::COMPILE_ERROR;
    result.score = 0;
    result.diagnostic = diagnostic;
    result.lang = lang;
    return result;
}

verdict verdict::infra_error(const string &diagnostic, optional<language> lang) {
    verdict result;
    result.status = verdict_status::INFRA_ERROR;
    result.score = 0;
    result.diagnostic = diagnostic;
    result.lang = lang;
    return result;
}

void to_json(json &j, const test_outcome &outcome) {
    j = {{"index", outcome.index},
         {"outcome", get_serialized_name(outcome.status)},
         {"time_ms", std::lround(outcome.time_ms)},
         {"score", outcome.score},
         {"message", outcome.message}};
    if (!outcome.stderr_data.empty())
        j["stderr"] = outcome.stderr_data;
}

void to_json(json &j, const verdict &v) {
    j = {{"status", get_serialized_name(v.status)},
         {"score", v.score},
         {"passed", v.passed()},
         {"total", v.total()},
         {"tests", v.tests}};
    if (v.lang) j["language"] = get_serialized_name(*v.lang);
    if (v.status == verdict_status::COMPILE_ERROR || v.status == verdict_status::INFRA_ERROR)
        j["diagnostic"] = v.diagnostic;
}

}  // namespace grader
