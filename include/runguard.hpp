#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief runguard 写入 meta 文件的运行信息
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief CPU 时间（用户态与内核态时间之和）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double cpu_time = -1;

    int exitcode = -1;

    /**
     * @brief 导致程序终止的信号，没有时为 -1
     * 超时被杀死的程序为 SIGALRM（wall time）或者 SIGXCPU（cpu time）
     */
    int signal = -1;

    /**
     * @brief runguard 自身出错时的错误信息，比如无法切换用户、无法创建输出文件
     */
    std::string internal_error;

    /**
     * @brief 最大常驻内存（单位为字节）
     */
    long long memory = -1;

    /**
     * @brief 为空表示没有超时，否则为 soft-timelimit 或 hard-timelimit
     */
    std::string time_result;

    /**
     * @brief 被截断的输出流，比如 "stdout" 或者 "stdout,stderr"
     */
    std::string output_truncated;

    /**
     * @brief 程序实际写入 stdout 的字节数（包括被截断丢弃的部分）
     */
    long long stdout_bytes = -1;

    bool timed_out() const;
};

/**
 * @brief 读取 runguard 的 meta 文件
 * @throw internal_error meta 文件不存在，说明 runguard 没有正常运行
 */
runguard_result read_runguard_result(const std::filesystem::path &metafile);

}  // namespace grader
