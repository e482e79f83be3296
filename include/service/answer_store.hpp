#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "catalog.hpp"

namespace grader {

/**
 * @brief 一个测试点的输入与标准输出
 * 只存在于 answer service 进程中
 */
struct test_case_data {
    std::string input;
    std::string expected;
};

/**
 * @brief 标准答案库
 * 在 answer service 启动时加载一次，之后只读。
 * 目录结构参见 GRADING_DIR。
 */
struct answer_store {
    /**
     * @brief 加载 catalog 中所有题目的测试数据
     * @param grading_dir 标准答案目录，包含 inputs 和 outputs 两个子目录
     * @throw catalog_error 测试数据编号不连续，或者输入与输出的数量不一致
     */
    static answer_store load(const catalog &problems, const std::filesystem::path &grading_dir);

    bool contains(const std::string &problem_id) const;

    /**
     * @brief 题目的测试点数量
     * @throw std::out_of_range 题目不存在
     */
    std::size_t count(const std::string &problem_id) const;

    /**
     * @brief 获得测试点数据
     * @param index 测试点编号，从 1 开始
     * @throw std::out_of_range 题目或者测试点不存在
     */
    const test_case_data &get(const std::string &problem_id, int index) const;

    /**
     * @brief 直接添加一道题的测试数据
     */
    void add(const std::string &problem_id, std::vector<test_case_data> &&test_cases);

private:
    std::map<std::string, std::vector<test_case_data>> problems;
};

}  // namespace grader
