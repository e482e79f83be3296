#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/submission.hpp"
#include "runguard.hpp"

namespace grader {

/**
 * @brief 编译得到的可运行程序
 * 对于 C++，command 为编译出的可执行文件；对于 Python，command 为解释器加源代码。
 * 所有测试点共享同一个 compiled_artifact，运行时只读。
 */
struct compiled_artifact {
    language lang;

    /**
     * @brief 运行选手程序的完整命令，路径均为绝对路径
     */
    std::vector<std::string> command;
};

/**
 * @brief 通过 runguard 运行一个程序时的限制
 */
struct sandbox_options {
    /**
     * @brief wall time 与 cpu time 限制，单位为秒
     */
    double time_limit = 1;

    /**
     * @brief 地址空间限制，单位为 MB，小于等于 0 表示不限制
     */
    int memory_limit_mb = -1;

    /**
     * @brief 程序的工作目录
     */
    std::filesystem::path work_dir;

    /**
     * @brief 标准输入文件，为空时不重定向
     */
    std::filesystem::path stdin_file;

    std::filesystem::path stdout_file;

    /**
     * @brief 标准错误输出文件，与 stdout_file 相同时两者合并
     */
    std::filesystem::path stderr_file;

    std::filesystem::path meta_file;

    /**
     * @brief 是否保留环境变量（编译器需要），选手程序只保留 PATH
     */
    bool preserve_env = false;
};

/**
 * @brief 通过 runguard 运行 command
 * @return runguard 写入 meta 文件的运行信息
 * @throw internal_error runguard 运行失败（没有生成 meta 文件，或者 meta 文件中包含 internal-error）
 */
runguard_result run_guarded(const sandbox_options &options, const std::vector<std::string> &command);

/**
 * @brief 一个测试点的运行结果
 */
struct execution_result {
    execution_status status = execution_status::OK;

    int exit_code = -1;

    /**
     * @brief 终止程序的信号，没有时为 -1
     */
    int signal = -1;

    /**
     * @brief 运行时间，单位为毫秒
     */
    double wall_time_ms = 0;

    double cpu_time_ms = 0;

    /**
     * @brief 最大常驻内存，单位为字节
     */
    long long memory_bytes = -1;

    std::string stdout_data;

    std::string stderr_data;

    /**
     * @brief 输出是否超出 STREAM_SIZE_LIMIT 而被截断
     */
    bool output_truncated = false;
};

/**
 * @brief 在 run_dir 中运行一个测试点
 * 运行前会清空 run_dir，并将 input_file 复制为 run_dir/testdata.in 作为标准输入。
 * @param artifact 编译得到的程序
 * @param input_file 测试点输入数据
 * @param time_limit 时间限制，单位为秒，超时后整个进程组都会被杀死
 * @param memory_limit_mb 内存限制
 * @param run_dir 运行目录，选手程序只能写入这个目录
 * @throw internal_error runguard 运行失败
 */
execution_result run_test_case(const compiled_artifact &artifact, const std::filesystem::path &input_file,
                               double time_limit, int memory_limit_mb, const std::filesystem::path &run_dir);

}  // namespace grader
