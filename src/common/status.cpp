#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<execution_status, const char *> execution_string = boost::assign::map_list_of
    (execution_status::OK, "OK")
    (execution_status::TIMEOUT, "Time Limit Exceeded")
    (execution_status::RUNTIME_ERROR, "Runtime Error");

static const unordered_map<test_status, const char *> test_string = boost::assign::map_list_of
    (test_status::PASSED, "Accepted")
    (test_status::FAILED, "Wrong Answer")
    (test_status::TIMEOUT, "Time Limit Exceeded")
    (test_status::RUNTIME_ERROR, "Runtime Error");

static const unordered_map<verdict_status, const char *> verdict_string = boost::assign::map_list_of
    (verdict_status::PASSED, "Passed")
    (verdict_status::PARTIAL, "Partial Correct")
    (verdict_status::FAILED, "Failed")
    (verdict_status::COMPILE_ERROR, "Compilation Error")
    (verdict_status::INFRA_ERROR, "System Error");

static const unordered_map<test_status, const char *> test_name = boost::assign::map_list_of
    (test_status::PASSED, "passed")
    (test_status::FAILED, "failed")
    (test_status::TIMEOUT, "timeout")
    (test_status::RUNTIME_ERROR, "runtime_error");

static const unordered_map<verdict_status, const char *> verdict_name = boost::assign::map_list_of
    (verdict_status::PASSED, "passed")
    (verdict_status::PARTIAL, "partial")
    (verdict_status::FAILED, "failed")
    (verdict_status::COMPILE_ERROR, "compile_error")
    (verdict_status::INFRA_ERROR, "infra_error");
// clang-format on

const char *get_display_message(execution_status stat) {
    return execution_string.at(stat);
}

const char *get_display_message(test_status stat) {
    return test_string.at(stat);
}

const char *get_display_message(verdict_status stat) {
    return verdict_string.at(stat);
}

const char *get_serialized_name(test_status stat) {
    return test_name.at(stat);
}

const char *get_serialized_name(verdict_status stat) {
    return verdict_name.at(stat);
}

}  // namespace grader
