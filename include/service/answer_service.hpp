#pragma once

#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include "catalog.hpp"
#include "checker/checker.hpp"
#include "common/socket.hpp"
#include "service/answer_store.hpp"
#include "service/protocol.hpp"

namespace grader {

/**
 * @brief answer service 的请求处理逻辑
 * 持有标准答案，只对外返回通过与否、得分以及不含标准输出的诊断信息。
 * 日志中只记录题目 id、测试点编号与 AC/WA。
 */
struct answer_service {
    answer_service(const catalog &problems, answer_store &&store, const checker_registry &registry);

    /**
     * @brief 处理一个请求，任何错误都会被转换为 {"status": "error"} 响应
     */
    nlohmann::json handle(const nlohmann::json &request) const;

    /**
     * @brief 处理一行 JSON 请求，返回一行 JSON 响应（包含换行符）
     */
    std::string handle_line(const std::string &line) const;

    protocol::check_reply check(const protocol::check_request &request) const;

    protocol::list_tests_reply list_tests(const std::string &problem_id) const;

private:
    const catalog &problems;
    answer_store store;
    const checker_registry &registry;
};

/**
 * @brief 如果诊断信息中包含标准输出的某一行或者某个 token，则替换为通用信息
 * 长度小于 4 的行与 token 不参与比较，否则诸如 "Line 1 differs" 这样的信息都会被替换
 */
std::string scrub_message(const std::string &message, const std::string &expected);

/**
 * @brief answer service 的网络层
 * 只监听回环地址，每个连接处理一个请求。
 */
struct answer_server {
    /**
     * @throw std::invalid_argument host 不是回环地址
     * @throw std::system_error 无法监听端口
     */
    answer_server(const answer_service &service, const std::string &host, int port);

    /**
     * @brief 实际监听的端口，port 为 0 时由系统分配
     */
    int port() const;

    /**
     * @brief 处理请求直到 stopped 为真
     */
    void serve(const std::atomic<bool> &stopped);

    /**
     * @brief 等待并处理一个连接
     * @return 是否处理了一个连接
     */
    bool serve_one(std::chrono::milliseconds wait);

private:
    const answer_service &service;
    socket_fd listener;
};

}  // namespace grader
