#include <algorithm>
#include "gtest/gtest.h"
#include "service/protocol.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace grader::protocol;
using namespace nlohmann;

TEST(ProtocolTest, CheckRequestTest) {
    check_request request;
    request.problem_id = "sum_pairs";
    request.test_case = 2;
    request.output = "3\n7\n";
    request.exited_cleanly = false;

    json j = request;
    EXPECT_JSON_EQ(j, json({{"method", "check"},
                            {"problem_id", "sum_pairs"},
                            {"test_case", 2},
                            {"output", "3\n7\n"},
                            {"exited_cleanly", false}}));

    auto parsed = j.get<check_request>();
    EXPECT_EQ(parsed.problem_id, "sum_pairs");
    EXPECT_EQ(parsed.test_case, 2);
    EXPECT_EQ(parsed.output, "3\n7\n");
    EXPECT_FALSE(parsed.exited_cleanly);
}

TEST(ProtocolTest, CheckRequestDefaultsTest) {
    auto parsed = json({{"problem_id", "a"}, {"test_case", 1}, {"output", ""}}).get<check_request>();
    EXPECT_TRUE(parsed.exited_cleanly);

    EXPECT_THROW(json({{"problem_id", "a"}, {"output", ""}}).get<check_request>(), std::invalid_argument);
    EXPECT_THROW(json({{"problem_id", "a"}, {"test_case", "one"}, {"output", ""}}).get<check_request>(), std::invalid_argument);
}

TEST(ProtocolTest, CheckReplyTest) {
    check_reply reply;
    reply.passed = false;
    reply.score = 0;
    reply.message = "Line 1 differs";

    json j = reply;
    EXPECT_JSON_EQ(j, json({{"status", "ok"},
                            {"verdict", "WA"},
                            {"passed", false},
                            {"score", 0.0},
                            {"message", "Line 1 differs"}}));

    auto parsed = json({{"status", "ok"}, {"passed", true}}).get<check_reply>();
    EXPECT_TRUE(parsed.passed);
    EXPECT_EQ(parsed.score, 1.0);
}

TEST(ProtocolTest, ListTestsReplyTest) {
    list_tests_reply reply;
    reply.problem_id = "sum_pairs";
    reply.tests = {1, 2, 3};

    json j = reply;
    EXPECT_JSON_EQ(j, json({{"status", "ok"},
                            {"problem_id", "sum_pairs"},
                            {"tests", {1, 2, 3}},
                            {"count", 3}}));
    EXPECT_EQ(j.get<list_tests_reply>().tests, vector<int>({1, 2, 3}));
}

TEST(ProtocolTest, ExpectOkTest) {
    EXPECT_NO_THROW(expect_ok({{"status", "ok"}}));
    EXPECT_THROW(expect_ok(make_error("unknown problem")), protocol_error);
    EXPECT_THROW(expect_ok({{"ready", true}}), protocol_error);
    EXPECT_THROW(expect_ok(json::array()), protocol_error);

    try {
        expect_ok(make_error("unknown problem"));
        FAIL();
    } catch (protocol_error &e) {
        EXPECT_STREQ(e.what(), "unknown problem");
    }
}

TEST(ProtocolTest, ToLineTest) {
    string line = to_line({{"method", "health"}});
    EXPECT_EQ(line, "{\"method\":\"health\"}\n");

    // 选手输出可能包含非法的 UTF-8，序列化时不能抛出异常
    check_request request;
    request.problem_id = "a";
    request.test_case = 1;
    request.output = "\xff\xfe" "abc\n";
    string invalid;
    EXPECT_NO_THROW(invalid = to_line(request));
    EXPECT_EQ(invalid.back(), '\n');
    EXPECT_EQ(std::count(invalid.begin(), invalid.end(), '\n'), 1);
}
