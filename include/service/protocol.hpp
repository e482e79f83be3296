#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * grader 与 answer service 之间的协议
 * 每个连接发送一行 JSON 请求，接收一行 JSON 响应：
 * {"method": "health"}
 *     -> {"status": "ok", "ready": true, "service": "answer-service"}
 * {"method": "list_tests", "problem_id": "sum_pairs"}
 *     -> {"status": "ok", "problem_id": "sum_pairs", "tests": [1, 2], "count": 2}
 * {"method": "check", "problem_id": "sum_pairs", "test_case": 1, "output": "3\n", "exited_cleanly": true}
 *     -> {"status": "ok", "verdict": "AC", "passed": true, "score": 1.0, "message": "OK"}
 * 出错时：
 *     -> {"status": "error", "message": "unknown problem"}
 * 响应中永远不会包含标准输出的内容。
 */
namespace grader::protocol {

/**
 * @brief 请求的最大长度，选手输出被 STREAM_SIZE_LIMIT 截断后再经过 JSON 转义，不会超过这个值
 */
constexpr std::size_t MAX_MESSAGE_SIZE = 512u << 20;

struct check_request {
    std::string problem_id;

    /**
     * @brief 测试点编号，从 1 开始
     */
    int test_case = 0;

    /**
     * @brief 选手程序的标准输出
     */
    std::string output;

    /**
     * @brief 选手程序是否以返回值 0 正常退出
     * 比较器可以声明忽略返回值，否则非正常退出的测试点不能通过
     */
    bool exited_cleanly = true;
};

struct check_reply {
    bool passed = false;

    /**
     * @brief 0~1 之间的得分
     */
    double score = 0;

    std::string message;
};

struct list_tests_reply {
    std::string problem_id;

    std::vector<int> tests;
};

/**
 * @brief 协议错误，比如请求格式不正确、题目或测试点不存在
 */
struct protocol_error : public std::runtime_error {
    explicit protocol_error(const std::string &message);
};

void to_json(nlohmann::json &j, const check_request &request);
void from_json(const nlohmann::json &j, check_request &request);

void to_json(nlohmann::json &j, const check_reply &reply);
void from_json(const nlohmann::json &j, check_reply &reply);

void to_json(nlohmann::json &j, const list_tests_reply &reply);
void from_json(const nlohmann::json &j, list_tests_reply &reply);

nlohmann::json make_error(const std::string &message);

/**
 * @brief 检查响应的 status 字段
 * @throw protocol_error 响应为 {"status": "error"} 或者格式不正确
 */
void expect_ok(const nlohmann::json &response);

/**
 * @brief 将 JSON 序列化为一行，非法 UTF-8 字节会被替换为 U+FFFD
 */
std::string to_line(const nlohmann::json &j);

}  // namespace grader::protocol
