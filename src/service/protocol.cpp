#include "service/protocol.hpp"
#include "common/json_utils.hpp"

namespace grader::protocol {
using namespace std;
using namespace nlohmann;

protocol_error::protocol_error(const string &message)
    : runtime_error(message) {}

void to_json(json &j, const check_request &request) {
    j = {{"method", "check"},
         {"problem_id", request.problem_id},
         {"test_case", request.test_case},
         {"output", request.output},
         {"exited_cleanly", request.exited_cleanly}};
}

void from_json(const json &j, check_request &request) {
    request.problem_id = get_value<string>(j, "problem_id");
    request.test_case = get_value<int>(j, "test_case");
    request.output = get_value<string>(j, "output");
    request.exited_cleanly = get_value_def<bool>(j, true, "exited_cleanly");
}

void to_json(json &j, const check_reply &reply) {
    j = {{"status", "ok"},
         {"verdict", reply.passed ? "AC" : "WA"},
         {"passed", reply.passed},
         {"score", reply.score},
         {"message", reply.message}};
}

void from_json(const json &j, check_reply &reply) {
    reply.passed = get_value<bool>(j, "passed");
    reply.score = get_value_def<double>(j, reply.passed ? 1.0 : 0.0, "score");
    reply.message = get_value_def<string>(j, "", "message");
}

void to_json(json &j, const list_tests_reply &reply) {
    j = {{"status", "ok"},
         {"problem_id", reply.problem_id},
         {"tests", reply.tests},
         {"count", reply.tests.size()}};
}

void from_json(const json &j, list_tests_reply &reply) {
    reply.problem_id = get_value<string>(j, "problem_id");
    reply.tests = get_value<vector<int>>(j, "tests");
}

json make_error(const string &message) {
    return {{"status", "error"}, {"message", message}};
}

void expect_ok(const json &response) {
    if (!response.is_object())
        throw protocol_error("malformed response");
    string status = get_value_def<string>(response, "", "status");
    if (status == "ok") return;
    if (status == "error")
        throw protocol_error(get_value_def<string>(response, "unknown error", "message"));
    throw protocol_error("malformed response");
}

string to_line(const json &j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

}  // namespace grader::protocol
