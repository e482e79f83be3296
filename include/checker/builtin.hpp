#pragma once

#include "checker/checker.hpp"

/**
 * 内置比较器
 * exact: 忽略行末空格和文末空行的精确比较（默认比较器）
 * exact-ignore-exitcode: 与 exact 相同，但不因为返回值非 0 判定失败
 * float: 按行比较，数字允许相对误差 1e-6、绝对误差 1e-9
 * unordered: 将所有 token 视为多重集合比较，不考虑顺序
 * pastele, rez, kolekcija: 多解题目的专用校验器
 */
namespace grader::checkers {

struct exact_checker : public checker {
    std::string name() const override;
    std::string tolerance_policy() const override;
    check_result check(const std::string &input, const std::string &expected, const std::string &actual) const override;
};

struct exact_ignore_exitcode_checker : public exact_checker {
    std::string name() const override;
    std::string tolerance_policy() const override;
    bool ignores_exit_code() const override;
};

struct float_checker : public checker {
    double rel_tol = 1e-6;
    double abs_tol = 1e-9;

    std::string name() const override;
    std::string tolerance_policy() const override;
    check_result check(const std::string &input, const std::string &expected, const std::string &actual) const override;
};

struct unordered_checker : public checker {
    std::string name() const override;
    std::string tolerance_policy() const override;
    check_result check(const std::string &input, const std::string &expected, const std::string &actual) const override;
};

/**
 * @brief PASTELE：从 N 支蜡笔中选出 K 支使得颜色差异最小
 * 校验：
 * 1. 第一行的颜色差异与标准输出一致
 * 2. 选出的每支蜡笔都在输入中出现，且使用次数不超过输入中的数量
 * 3. 根据选出的蜡笔重新计算的颜色差异与第一行一致
 */
struct pastele_checker : public checker {
    std::string name() const override;
    std::string tolerance_policy() const override;
    check_result check(const std::string &input, const std::string &expected, const std::string &actual) const override;
};

/**
 * @brief REZ：用最少的直线把蛋糕切成至少 K 块
 * 蛋糕是 [-5000, 5000] x [-5000, 5000] 的正方形，每刀的两个端点都必须在边界上。
 * 校验：
 * 1. 刀数与标准输出一致
 * 2. 每刀的端点都在边界上
 * 3. 1 + N + 蛋糕内部交点数 >= K
 */
struct rez_checker : public checker {
    std::string name() const override;
    std::string tolerance_policy() const override;
    check_result check(const std::string &input, const std::string &expected, const std::string &actual) const override;
};

/**
 * @brief KOLEKCIJA：为每首歌选择长度为 K 的读取区间，使读盘次数最少
 * 校验：
 * 1. 读盘次数与标准输出一致
 * 2. 每个区间长度为 K，在 [1, N] 内，且包含对应的歌曲
 * 3. 所有区间覆盖的不同歌曲数等于声明的读盘次数
 */
struct kolekcija_checker : public checker {
    std::string name() const override;
    std::string tolerance_policy() const override;
    check_result check(const std::string &input, const std::string &expected, const std::string &actual) const override;
};

}  // namespace grader::checkers
