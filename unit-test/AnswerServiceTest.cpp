#include <atomic>
#include <thread>
#include "checker/builtin.hpp"
#include "common/exceptions.hpp"
#include "common/socket.hpp"
#include "gtest/gtest.h"
#include "service/answer_client.hpp"
#include "service/answer_service.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace grader;
using namespace nlohmann;

static const string SECRET = "MARKER_7f3a9c_SECRET";

/**
 * @brief 故意把标准输出写进诊断信息的比较器
 */
struct leaky_checker : public checker {
    string name() const override { return "leaky"; }
    string tolerance_policy() const override { return "exact comparison, echoes the expected output"; }
    check_result check(const string &, const string &expected, const string &actual) const override {
        if (normalize_output(expected) == normalize_output(actual))
            return check_result::accept();
        return check_result::reject("expected " + expected + " but got " + actual);
    }
};

/**
 * @brief 给出部分分的比较器，得分为选手输出中 token 的数量除以 10
 */
struct partial_checker : public checker {
    string name() const override { return "partial"; }
    string tolerance_policy() const override { return "score is the number of tokens divided by 10"; }
    check_result check(const string &, const string &, const string &actual) const override {
        check_result result = check_result::accept("partial");
        result.score = split_tokens(actual).size() / 10.0;
        return result;
    }
};

class AnswerServiceTest : public ::testing::Test {
protected:
    checker_registry registry;
    catalog problems;
    unique_ptr<answer_service> service;

    void SetUp() override {
        register_builtin_checkers(registry);
        registry.add(make_unique<leaky_checker>());
        registry.add(make_unique<partial_checker>());

        problems = catalog::parse(
            {{"problems", json::array({
                              {{"id", "sum_pairs"}, {"time_limit_seconds", 1}},
                              {{"id", "lenient"}, {"time_limit_seconds", 1}, {"checker", "exact-ignore-exitcode"}},
                              {{"id", "secret"}, {"time_limit_seconds", 1}, {"checker", "leaky"}},
                              {{"id", "pastele"}, {"time_limit_seconds", 1}, {"checker", "pastele"}},
                              {{"id", "partial"}, {"time_limit_seconds", 1}, {"checker", "partial"}},
                          })}},
            registry);

        answer_store store;
        store.add("sum_pairs", {{"1 2\n", "3\n"}, {"3 4\n", "7\n"}});
        store.add("lenient", {{"", "ok\n"}});
        store.add("secret", {{"", SECRET + "\n"}});
        store.add("pastele", {{"3 2\n0 0 0\n10 10 10\n12 0 5\n", "10\n0 0 0\n10 10 10\n"}});
        store.add("partial", {{"", "unused\n"}});
        service = make_unique<answer_service>(problems, move(store), registry);
    }

    protocol::check_reply check(const string &problem_id, int test_case, const string &output, bool exited_cleanly = true) {
        protocol::check_request request;
        request.problem_id = problem_id;
        request.test_case = test_case;
        request.output = output;
        request.exited_cleanly = exited_cleanly;
        return service->check(request);
    }
};

TEST_F(AnswerServiceTest, HealthTest) {
    EXPECT_JSON_EQ(service->handle({{"method", "health"}}),
                   json({{"status", "ok"}, {"ready", true}, {"service", "answer-service"}}));
}

TEST_F(AnswerServiceTest, ListTestsTest) {
    EXPECT_JSON_EQ(service->handle({{"method", "list_tests"}, {"problem_id", "sum_pairs"}}),
                   json({{"status", "ok"}, {"problem_id", "sum_pairs"}, {"tests", {1, 2}}, {"count", 2}}));

    json error = service->handle({{"method", "list_tests"}, {"problem_id", "nonexistent"}});
    EXPECT_EQ(error["status"], "error");
}

TEST_F(AnswerServiceTest, CheckTest) {
    auto accepted = check("sum_pairs", 1, "3\r\n\n");
    EXPECT_TRUE(accepted.passed);
    EXPECT_EQ(accepted.score, 1.0);

    auto rejected = check("sum_pairs", 2, "8\n");
    EXPECT_FALSE(rejected.passed);
    EXPECT_EQ(rejected.score, 0.0);
    EXPECT_EQ(rejected.message, "Line 1 differs");
}

TEST_F(AnswerServiceTest, CheckThroughJsonTest) {
    json response = service->handle({{"method", "check"}, {"problem_id", "sum_pairs"}, {"test_case", 1}, {"output", "3\n"}, {"exited_cleanly", true}});
    EXPECT_EQ(response["status"], "ok");
    EXPECT_EQ(response["verdict"], "AC");
    EXPECT_EQ(response["passed"], true);
}

TEST_F(AnswerServiceTest, UnknownTestCaseTest) {
    for (int test_case : {0, 3, -1}) {
        json response = service->handle({{"method", "check"}, {"problem_id", "sum_pairs"}, {"test_case", test_case}, {"output", "3\n"}});
        EXPECT_JSON_EQ(response, json({{"status", "error"}, {"message", "unknown test case"}}));
    }
    json response = service->handle({{"method", "check"}, {"problem_id", "nonexistent"}, {"test_case", 1}, {"output", ""}});
    EXPECT_JSON_EQ(response, json({{"status", "error"}, {"message", "unknown problem"}}));
}

TEST_F(AnswerServiceTest, MalformedRequestTest) {
    EXPECT_EQ(service->handle(json::array())["status"], "error");
    EXPECT_EQ(service->handle({{"method", "nonexistent"}})["status"], "error");
    EXPECT_EQ(service->handle({{"problem_id", "sum_pairs"}})["status"], "error");
    EXPECT_EQ(service->handle({{"method", "check"}, {"problem_id", "sum_pairs"}})["status"], "error");

    string line = service->handle_line("{not json");
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(json::parse(line)["status"], "error");
}

TEST_F(AnswerServiceTest, StrictExitCodePolicyTest) {
    auto reply = check("sum_pairs", 1, "3\n", false);
    EXPECT_FALSE(reply.passed);
    EXPECT_EQ(reply.score, 0.0);
    EXPECT_EQ(reply.message, "Output accepted but the program exited abnormally");

    // 输出错误时保留比较器的信息
    EXPECT_EQ(check("sum_pairs", 1, "4\n", false).message, "Line 1 differs");
}

TEST_F(AnswerServiceTest, LenientExitCodePolicyTest) {
    EXPECT_TRUE(check("lenient", 1, "ok\n", false).passed);
    EXPECT_TRUE(check("lenient", 1, "ok\n", true).passed);
    EXPECT_FALSE(check("lenient", 1, "no\n", false).passed);
}

TEST_F(AnswerServiceTest, CheckerExceptionTest) {
    auto reply = check("pastele", 1, "10\nred green blue\n0 0 0\n");
    EXPECT_FALSE(reply.passed);
    EXPECT_EQ(reply.message, "checker rejected output");

    EXPECT_TRUE(check("pastele", 1, "10\n10 10 10\n12 0 5\n").passed);
}

TEST_F(AnswerServiceTest, PartialScoreTest) {
    auto reply = check("partial", 1, "a b c");
    EXPECT_TRUE(reply.passed);
    EXPECT_DOUBLE_EQ(reply.score, 0.3);

    // 得分被限制在 [0, 1] 内
    EXPECT_DOUBLE_EQ(check("partial", 1, "a b c d e f g h i j k l").score, 1.0);
}

TEST_F(AnswerServiceTest, ScrubMessageTest) {
    EXPECT_EQ(scrub_message("Line 1 differs", "3\n7\n"), "Line 1 differs");
    EXPECT_EQ(scrub_message("expected hello world", "hello world\n"), "Wrong answer");
    EXPECT_EQ(scrub_message("saw secret", "the secret is here\n"), "Wrong answer");  // token 也会被检查
    EXPECT_EQ(scrub_message("saw abc", "abc\n"), "saw abc");                        // 太短的 token 不参与比较
    EXPECT_EQ(scrub_message("anything", ""), "anything");
}

TEST_F(AnswerServiceTest, ExpectedOutputNeverLeaksTest) {
    vector<string> outputs = {
        "",
        "\n",
        SECRET.substr(0, SECRET.size() / 2),
        SECRET + SECRET,
        "MARKER",
        "\xff\xfe\xfd",
        string(100000, 'x'),
        "1 2 3\n4 5 6\n",
        SECRET + "\n",
    };

    for (auto &output : outputs) {
        for (bool exited_cleanly : {true, false}) {
            json response = service->handle({{"method", "check"}, {"problem_id", "secret"}, {"test_case", 1}, {"output", output}, {"exited_cleanly", exited_cleanly}});
            string line = protocol::to_line(response);
            // 选手输出本身就是 SECRET 时响应里也不会回显选手输出
            EXPECT_EQ(line.find(SECRET), string::npos) << line;
        }
    }

    for (auto &request : {json({{"method", "list_tests"}, {"problem_id", "secret"}}),
                          json({{"method", "check"}, {"problem_id", "secret"}, {"test_case", 2}, {"output", ""}}),
                          json({{"method", "health"}})}) {
        string line = service->handle_line(request.dump());
        EXPECT_EQ(line.find(SECRET), string::npos) << line;
    }
}

TEST_F(AnswerServiceTest, LoopbackAddressTest) {
    EXPECT_TRUE(is_loopback_address("127.0.0.1"));
    EXPECT_TRUE(is_loopback_address("127.1.2.3"));
    EXPECT_TRUE(is_loopback_address("::1"));
    EXPECT_TRUE(is_loopback_address("::ffff:127.0.0.1"));
    EXPECT_TRUE(is_loopback_address("localhost"));
    EXPECT_FALSE(is_loopback_address("0.0.0.0"));
    EXPECT_FALSE(is_loopback_address("::"));
    EXPECT_FALSE(is_loopback_address("10.0.0.1"));
    EXPECT_FALSE(is_loopback_address("example.com"));
}

TEST_F(AnswerServiceTest, RefuseNonLoopbackBindTest) {
    EXPECT_THROW(answer_server(*service, "0.0.0.0", 0), std::invalid_argument);
    EXPECT_THROW(answer_server(*service, "8.8.8.8", 0), std::invalid_argument);
}

TEST_F(AnswerServiceTest, TcpRoundTripTest) {
    answer_server server(*service, "127.0.0.1", 0);
    ASSERT_GT(server.port(), 0);

    atomic<bool> stopped(false);
    thread serving([&] { server.serve(stopped); });

    tcp_answer_client client("127.0.0.1", server.port(), chrono::milliseconds(2000));
    EXPECT_NO_THROW(wait_until_ready(client, chrono::milliseconds(5000)));
    EXPECT_TRUE(client.health());
    EXPECT_EQ(client.list_tests("sum_pairs"), vector<int>({1, 2}));

    protocol::check_request request;
    request.problem_id = "sum_pairs";
    request.test_case = 2;
    request.output = "7\n";
    EXPECT_TRUE(client.check(request).passed);

    request.output = "8\n";
    auto reply = client.check(request);
    EXPECT_FALSE(reply.passed);
    EXPECT_EQ(reply.message, "Line 1 differs");

    // 服务端返回错误时客户端报告 infra_error
    EXPECT_THROW(client.list_tests("nonexistent"), infra_error);

    stopped = true;
    serving.join();
}
