#pragma once

#include <filesystem>
#include "judge/sandbox.hpp"
#include "judge/submission.hpp"

namespace grader {

/**
 * @brief 编译选手代码
 * 源代码会被复制到 compile_dir 中再编译，编译器通过 runguard 运行，
 * 编译时间受 COMPILE_TIME_LIMIT 限制。编译结束后 compile_dir 会被删除，
 * 编译出的程序被复制到 artifact_dir 中。
 * artifact_dir 属于评测进程所在用户，选手程序只能读取和执行其中的文件，
 * 因此所有测试点运行的都是同一个程序。
 * 对于 Python，不需要编译，源代码直接复制到 artifact_dir 中，返回调用解释器的命令。
 * @param submit 选手提交
 * @param compile_dir 编译目录，会被清空，编译结束后删除
 * @param artifact_dir 存放编译结果的目录，会被清空
 * @return 可以运行的程序
 * @throw compilation_error 编译失败，error_log 为编译器输出
 * @throw internal_error runguard 运行失败
 */
compiled_artifact compile(const submission &submit, const std::filesystem::path &compile_dir,
                          const std::filesystem::path &artifact_dir);

}  // namespace grader
