#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    template <typename T>
    grader_exception operator<<(const T &t) const {
        return grader_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是 runguard 或者文件系统操作失败
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示评测基础设施错误
 * 通常是 answer service 无法连接、未就绪或者响应超时，
 * 这类错误不能算到选手程序头上，评测结果应为 infra_error
 */
struct infra_error : public grader_exception {
    infra_error();
    explicit infra_error(const std::string &message);
};

/**
 * @brief 表示题目目录或配置错误
 * 比如题目 id 重复、时间限制不合法、测试数据编号不连续。
 * 这类错误必须在开始评测之前被发现
 */
struct catalog_error : public grader_exception {
    catalog_error();
    explicit catalog_error(const std::string &message);
};

/**
 * @brief 表示比较器不存在或者实现不合法
 * 只会在加载题目目录、解析比较器时抛出，不会在评测时抛出
 */
struct checker_error : public grader_exception {
    checker_error();
    explicit checker_error(const std::string &message);
};

}  // namespace grader
