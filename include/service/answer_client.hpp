#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "service/protocol.hpp"

namespace grader {

/**
 * @brief grader 访问 answer service 的接口
 * 所有方法在 answer service 不可用时抛出 infra_error
 */
struct answer_client {
    virtual ~answer_client();

    /**
     * @brief answer service 是否就绪
     * @return 就绪时返回 true，无法连接时返回 false
     */
    virtual bool health() = 0;

    /**
     * @brief 获得题目的测试点编号列表
     * @throw infra_error answer service 不可用或者不认识该题目
     */
    virtual std::vector<int> list_tests(const std::string &problem_id) = 0;

    /**
     * @brief 请求 answer service 比较选手输出
     * @throw infra_error answer service 不可用或者拒绝了请求
     */
    virtual protocol::check_reply check(const protocol::check_request &request) = 0;
};

/**
 * @brief 通过本地 TCP 连接访问 answer service
 * 每次请求建立一个新连接，超时后最多重试一次。
 */
struct tcp_answer_client : public answer_client {
    tcp_answer_client(const std::string &host, int port, std::chrono::milliseconds timeout);

    bool health() override;

    std::vector<int> list_tests(const std::string &problem_id) override;

    protocol::check_reply check(const protocol::check_request &request) override;

private:
    std::string host;
    int port;
    std::chrono::milliseconds timeout;

    /**
     * @brief 发送一次请求并等待响应
     * @throw std::system_error 连接、发送或接收失败
     */
    nlohmann::json call_once(const std::string &line);

    /**
     * @brief 发送请求，失败时重试一次
     * @throw infra_error 两次都失败，或者响应为错误
     */
    nlohmann::json call(const nlohmann::json &request);
};

/**
 * @brief 等待 answer service 就绪
 * @param timeout 最长等待时间
 * @param interval 两次检查之间的间隔
 * @throw infra_error 超时仍未就绪
 */
void wait_until_ready(answer_client &client, std::chrono::milliseconds timeout,
                      std::chrono::milliseconds interval = std::chrono::milliseconds(200));

}  // namespace grader
