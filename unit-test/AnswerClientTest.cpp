#include <chrono>
#include "common/exceptions.hpp"
#include "common/socket.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "service/answer_client.hpp"
#include "test/mock_answer_client.hpp"

using namespace std;
using namespace grader;
using ::testing::Return;

/**
 * @brief 找一个当前没有被监听的端口
 */
static int unused_port() {
    socket_fd listener = listen_loopback("127.0.0.1", 0);
    return local_port(listener);
}

TEST(AnswerClientTest, ServiceDownTest) {
    tcp_answer_client client("127.0.0.1", unused_port(), chrono::milliseconds(500));
    EXPECT_FALSE(client.health());
    EXPECT_THROW(client.list_tests("sum_pairs"), infra_error);

    protocol::check_request request;
    request.problem_id = "sum_pairs";
    request.test_case = 1;
    EXPECT_THROW(client.check(request), infra_error);
}

TEST(AnswerClientTest, NonLoopbackHostTest) {
    tcp_answer_client client("10.0.0.1", 5000, chrono::milliseconds(500));
    EXPECT_FALSE(client.health());
    EXPECT_THROW(client.list_tests("sum_pairs"), infra_error);
}

TEST(AnswerClientTest, UnresponsiveServiceTest) {
    // 只监听不处理连接，连接会停在 backlog 中，请求永远得不到响应
    socket_fd listener = listen_loopback("127.0.0.1", 0);
    tcp_answer_client client("127.0.0.1", local_port(listener), chrono::milliseconds(300));

    auto begin = chrono::steady_clock::now();
    EXPECT_THROW(client.list_tests("sum_pairs"), infra_error);
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - begin).count();

    // 第一次请求超时后重试一次，然后放弃
    EXPECT_GE(elapsed, 500);
    EXPECT_LT(elapsed, 3000);
}

TEST(AnswerClientTest, WaitUntilReadyTest) {
    mock::mock_answer_client client;
    EXPECT_CALL(client, health())
        .WillOnce(Return(false))
        .WillOnce(Return(false))
        .WillOnce(Return(true));
    EXPECT_NO_THROW(wait_until_ready(client, chrono::milliseconds(5000), chrono::milliseconds(10)));
}

TEST(AnswerClientTest, WaitUntilReadyTimeoutTest) {
    mock::mock_answer_client client;
    EXPECT_CALL(client, health()).WillRepeatedly(Return(false));

    auto begin = chrono::steady_clock::now();
    EXPECT_THROW(wait_until_ready(client, chrono::milliseconds(300), chrono::milliseconds(50)), infra_error);
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - begin).count();
    EXPECT_GE(elapsed, 200);
    EXPECT_LT(elapsed, 2000);
}
