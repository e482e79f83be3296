#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 选手程序可以读取的题目目录，只包含输入数据
 *
 * PROBLEMS_DIR
 * ├── catalog.json // 题目列表，参见 catalog.hpp
 * └── sum_pairs // problem id
 *     └── input
 *         ├── 1.txt // 第 1 个测试点的输入数据
 *         └── 2.txt
 */
extern std::filesystem::path PROBLEMS_DIR;

/**
 * @brief 只有 answer service 所在用户可以读取的标准答案目录
 * 评测时 grader 与选手程序都不可以访问这个目录
 *
 * GRADING_DIR
 * ├── inputs
 * │   └── sum_pairs
 * │       ├── 1.txt
 * │       └── 2.txt
 * └── outputs
 *     └── sum_pairs
 *         ├── 1.txt // 第 1 个测试点的标准输出
 *         └── 2.txt
 */
extern std::filesystem::path GRADING_DIR;

/**
 * @brief 选手程序编译及运行的根目录
 *
 * RUN_DIR
 * └── sum_pairs // problem id，同一道题同时只能有一个评测在进行
 *     ├── .lock
 *     ├── compile // 选手程序的代码和编译目录
 *     │   ├── main.cpp
 *     │   ├── program // 编译得到的可执行文件
 *     │   ├── compile.out // 编译器的输出
 *     │   └── compile.meta // 编译器的运行信息
 *     └── run // 每个测试点开始前都会被清空
 *         ├── testdata.in // 当前测试点的输入数据
 *         ├── program.out // 选手程序的 stdout 输出
 *         ├── program.err // 选手程序的 stderr 输出
 *         └── program.meta // 选手程序的运行信息
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief runguard 可执行文件的路径
 */
extern std::filesystem::path RUNGUARD;

/**
 * @brief 运行选手程序的受限用户，为空时以当前用户运行
 * 评测系统以 root 运行时必须设置该项，除非开启了 DEBUG 模式
 */
extern std::string RUN_USER;

/**
 * @brief 运行选手程序的受限用户组，为空时与 RUN_USER 一致
 */
extern std::string RUN_GROUP;

/**
 * @brief 编译时间限制，单位为秒
 */
extern double COMPILE_TIME_LIMIT;

/**
 * @brief 编译器内存限制，单位为 MB，小于 0 表示不限制
 */
extern int COMPILE_MEMORY_LIMIT;

/**
 * @brief 选手程序 stdout、stderr 的最大保存大小，单位为 KB
 */
extern int STREAM_SIZE_LIMIT;

/**
 * @brief 选手程序在工作路径下创建的单个文件的最大大小，单位为 KB，小于等于 0 表示不限制
 * 超出时选手程序会收到 SIGXFSZ，按运行错误处理
 */
extern int FILE_SIZE_LIMIT;

/**
 * @brief 每个测试点报告给选手的 stderr 最大长度，单位为字节
 */
extern int STDERR_REPORT_LIMIT;

/**
 * @brief 选手程序最多能同时存在多少个进程，小于 0 表示不限制
 */
extern int PROC_LIMIT;

/**
 * @brief C++ 编译器及固定的编译参数
 */
extern std::string CXX_COMPILER;
extern std::vector<std::string> CXX_FLAGS;

/**
 * @brief Python 解释器
 */
extern std::string PYTHON_INTERPRETER;

/**
 * @brief answer service 监听的地址，只允许回环地址
 */
extern std::string ANSWER_SERVICE_HOST;

extern int ANSWER_SERVICE_PORT;

/**
 * @brief 访问 answer service 的超时时间，单位为毫秒
 * 超时后最多重试一次，之后报告 infra_error
 */
extern int ANSWER_SERVICE_TIMEOUT_MS;

/**
 * @brief 等待 answer service 就绪的最长时间，单位为毫秒
 */
extern int ANSWER_SERVICE_STARTUP_MS;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统将允许以 root 运行选手程序，
 * 并且不会删除产生的运行目录，以便手动检查测试产生的文件内容是否符合预期。
 */
extern bool DEBUG;

}  // namespace grader
