#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "catalog.hpp"
#include "judge/sandbox.hpp"
#include "judge/verdict.hpp"
#include "service/answer_client.hpp"

namespace grader {

/**
 * @brief 一次评测的状态
 * PENDING -> COMPILING -> (COMPILE_FAILED | RUNNING) -> AGGREGATED
 * RUNNING 阶段按编号依次对每个测试点执行 EXECUTING -> CHECKING
 */
enum class grading_state {
    PENDING,
    COMPILING,
    COMPILE_FAILED,
    RUNNING,
    EXECUTING,
    CHECKING,
    AGGREGATED
};

const char *get_display_message(grading_state);

/**
 * @brief 评测请求
 * source 与 workdir 二选一：指定 source 时直接评测该文件，
 * 否则在 workdir 中查找 <problem_id>.cpp 或 <problem_id>.py
 */
struct grading_request {
    std::string problem_id;
    std::filesystem::path source;
    std::filesystem::path workdir;
};

/**
 * @brief 评测流程
 * 编译一次，然后按编号依次运行每个测试点，将输出交给 answer service 比较，最后汇总。
 * grader 自身从不读取标准输出。
 */
struct orchestrator {
    /**
     * @brief 状态变化的监听器，参数为新状态与当前测试点编号（不在测试点中时为 0）
     */
    typedef std::function<void(grading_state, int)> state_listener;

    /**
     * @param problems 题目目录
     * @param client answer service 客户端
     * @param problems_dir 选手可读的题目目录，包含每个测试点的输入数据
     * @param run_dir 编译与运行的根目录
     */
    orchestrator(const catalog &problems, answer_client &client,
                 const std::filesystem::path &problems_dir, const std::filesystem::path &run_dir);

    /**
     * @brief 评测一个提交
     * 选手程序的错误、answer service 的错误都会体现在返回的 verdict 中
     * @throw catalog_error 题目不存在，或者题目的输入数据不完整，此时不会开始评测
     */
    verdict grade(const grading_request &request);

    grading_state state() const;

    void set_listener(state_listener listener);

private:
    const catalog &problems;
    answer_client &client;
    std::filesystem::path problems_dir;
    std::filesystem::path run_dir;
    grading_state current = grading_state::PENDING;
    state_listener listener;

    void transit(grading_state next, int test_case = 0);

    test_outcome grade_test_case(const problem_spec &spec, const compiled_artifact &artifact,
                                 const std::filesystem::path &input_file, int index);
};

}  // namespace grader
