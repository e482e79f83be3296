#pragma once

#include <string>

namespace grader {

/**
 * @brief 表示一次程序运行（编译或者运行一个测试点）的结果
 */
enum class execution_status {
    /**
     * @brief 程序正常退出（返回值为 0）
     */
    OK = 0,

    /**
     * @brief 程序运行时间超出限制，整个进程组已被强制终止
     */
    TIMEOUT = 1,

    /**
     * @brief 程序返回了非 0 的返回值，或者因为信号崩溃
     * 此时程序输出仍然会被保存，并交给比较器判断
     */
    RUNTIME_ERROR = 2
};

/**
 * @brief 表示单个测试点的评测结果
 */
enum class test_status {
    /**
     * @brief 比较器判定选手输出正确
     */
    PASSED = 0,

    /**
     * @brief 比较器判定选手输出错误
     */
    FAILED = 1,

    /**
     * @brief 选手程序在该测试点超时，不会调用比较器
     */
    TIMEOUT = 2,

    /**
     * @brief 选手程序在该测试点运行错误，且比较器未接受其输出
     */
    RUNTIME_ERROR = 3
};

/**
 * @brief 表示整个提交的评测结果
 */
enum class verdict_status {
    /**
     * @brief 所有测试点均通过
     */
    PASSED = 0,

    /**
     * @brief 部分测试点通过
     */
    PARTIAL = 1,

    /**
     * @brief 没有测试点通过
     */
    FAILED = 2,

    /**
     * @brief 选手程序编译失败
     * 附带编译器输出，分数为 0
     */
    COMPILE_ERROR = 3,

    /**
     * @brief 评测系统自身出错，比如 answer service 无法访问。
     * 与 FAILED 区分开，以便调用方重试，而不是算作选手的错误
     */
    INFRA_ERROR = 4
};

const char *get_display_message(execution_status);

const char *get_display_message(test_status);

const char *get_display_message(verdict_status);

/**
 * @brief 序列化时使用的名称，比如 "runtime_error"
 */
const char *get_serialized_name(test_status);

const char *get_serialized_name(verdict_status);

}  // namespace grader
