#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/submission.hpp"

namespace grader {

/**
 * @brief 单个测试点的评测结果
 */
struct test_outcome {
    /**
     * @brief 测试点编号，从 1 开始
     */
    int index = 0;

    test_status status = test_status::FAILED;

    /**
     * @brief 运行时间，单位为毫秒
     */
    double time_ms = 0;

    /**
     * @brief 该测试点的得分（0~1），比较器未给出部分分时为 1 或 0
     */
    double score = 0;

    /**
     * @brief 比较器或者运行阶段给出的诊断信息，不包含标准输出
     */
    std::string message;

    /**
     * @brief 选手程序 stderr 的前 STDERR_REPORT_LIMIT 个字节
     */
    std::string stderr_data;
};

/**
 * @brief 一次评测的最终结果
 * 构造之后不再修改，相同的提交与测试数据总是得到相同的 verdict（超时附近的抖动除外）
 */
struct verdict {
    verdict_status status = verdict_status::INFRA_ERROR;

    /**
     * @brief 通过的测试点数量 / 测试点总数
     */
    double score = 0;

    /**
     * @brief 按测试点编号升序排列的结果，编译错误时为空
     */
    std::vector<test_outcome> tests;

    /**
     * @brief 编译错误时为编译器输出，评测系统错误时为错误原因
     */
    std::string diagnostic;

    std::optional<language> lang;

    int passed() const;

    int total() const;

    /**
     * @brief 根据各测试点结果汇总
     * 全部通过为 passed，部分通过为 partial，全部未通过为 failed。
     * tests 会按编号重新排序，与完成顺序无关
     */
    static verdict aggregate(std::vector<test_outcome> tests, std::optional<language> lang = std::nullopt);

    static verdict compile_error(const std::string &diagnostic, std::optional<language> lang = std::nullopt);

    static verdict infra_error(const std::string &diagnostic, std::optional<language> lang = std::nullopt);
};

void to_json(nlohmann::json &j, const test_outcome &outcome);

void to_json(nlohmann::json &j, const verdict &v);

}  // namespace grader
