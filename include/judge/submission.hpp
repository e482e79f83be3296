#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace grader {

/**
 * @brief 选手代码的语言，根据源代码扩展名判断
 */
enum class language {
    /**
     * @brief .cpp, .cc, .cxx，需要先编译
     */
    CPP,

    /**
     * @brief .py，直接交给解释器运行
     */
    PYTHON
};

const char *get_serialized_name(language);

/**
 * @brief 表示 program 编译错误
 * 可以表示源代码语言不被支持、找不到源代码，或者编译器报错
 */
struct compilation_error : public std::runtime_error {
public:
    /**
     * @brief 给选手看的编译信息
     */
    const std::string error_log;

    explicit compilation_error(const std::string &what, const std::string &error_log);
};

/**
 * @brief 一个选手提交
 * 每次评测请求创建一个，评测完成后丢弃
 */
struct submission {
    std::string problem_id;

    /**
     * @brief 选手代码的绝对路径
     */
    std::filesystem::path source;

    language lang;
};

/**
 * @brief 根据源代码扩展名创建提交
 * @throw compilation_error 扩展名不被支持，或者源代码不存在
 */
submission make_submission(const std::string &problem_id, const std::filesystem::path &source);

/**
 * @brief 在选手的工作目录中查找该题的代码
 * 依次查找 <problem_id>.cpp、<problem_id>.py，C++ 优先
 * @throw compilation_error 两个文件都不存在
 */
submission locate_submission(const std::string &problem_id, const std::filesystem::path &workdir);

}  // namespace grader
