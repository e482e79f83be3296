#pragma once

#include "gmock/gmock.h"
#include "service/answer_client.hpp"
#include "service/answer_service.hpp"

namespace grader::mock {

/**
 * @brief 不经过网络，直接在进程内调用 answer_service 的客户端
 * 与 tcp_answer_client 一样，错误响应会被转换为 infra_error
 */
struct local_answer_client : public answer_client {
    explicit local_answer_client(const answer_service &service);

    bool health() override;

    std::vector<int> list_tests(const std::string &problem_id) override;

    protocol::check_reply check(const protocol::check_request &request) override;

    /**
     * @brief 收到的 check 请求，按收到的顺序排列
     */
    std::vector<protocol::check_request> requests;

private:
    const answer_service &service;

    nlohmann::json call(const nlohmann::json &request);
};

struct mock_answer_client : public answer_client {
    MOCK_METHOD(bool, health, (), (override));
    MOCK_METHOD(std::vector<int>, list_tests, (const std::string &problem_id), (override));
    MOCK_METHOD(protocol::check_reply, check, (const protocol::check_request &request), (override));
};

}  // namespace grader::mock
