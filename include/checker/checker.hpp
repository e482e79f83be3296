#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含比较器（checker）的接口以及比较器注册表。
 * 比较器负责判断选手输出对于给定的标准输出是否可以接受，
 * 只在 answer service 进程内执行，因此可以看到标准输出。
 */
namespace grader {

/**
 * @brief 比较器的判定结果
 */
struct check_result {
    /**
     * @brief 选手输出是否被接受
     */
    bool passed = false;

    /**
     * @brief 支持部分分的比较器在这里给出 0~1 之间的得分
     * 为空时，得分由 passed 决定（1 或者 0）
     */
    std::optional<double> score;

    /**
     * @brief 给选手看的诊断信息
     * @note 绝对不能包含标准输出的任何内容
     */
    std::string message;

    static check_result accept(const std::string &message = "OK");

    static check_result reject(const std::string &message);
};

/**
 * @brief 比较器接口
 * 比较器必须是纯函数：不能读写文件，不能保存状态，相同的输入必须得到相同的结果。
 * 每个比较器都必须显式声明自己的容错策略，不允许猜测选手的意图。
 */
struct checker {
    virtual ~checker();

    /**
     * @brief 比较器在注册表中的名称，题目配置通过这个名称引用比较器
     */
    virtual std::string name() const = 0;

    /**
     * @brief 比较器的容错策略说明，比如是否忽略行末空格、是否允许浮点误差
     */
    virtual std::string tolerance_policy() const = 0;

    /**
     * @brief 选手程序返回非 0 时，是否仍然允许通过
     * 默认不允许：即使输出完全正确，运行错误的测试点也算失败
     */
    virtual bool ignores_exit_code() const;

    /**
     * @brief 比较选手输出
     * @param input 测试点的输入数据，部分题目需要输入数据才能验证构造
     * @param expected 标准输出
     * @param actual 选手输出
     * @throw std::exception 选手输出格式无法解析时可以抛出异常，调用方会将其视为失败
     */
    virtual check_result check(const std::string &input, const std::string &expected, const std::string &actual) const = 0;
};

typedef std::unique_ptr<checker> checker_ptr;

/**
 * @brief 比较器注册表
 * 注册表只会在进程启动时构建，之后只读，因此可以被多个线程同时访问
 */
struct checker_registry {
    /**
     * @brief 题目没有指定比较器时使用的比较器
     */
    static constexpr const char *DEFAULT_CHECKER = "exact";

    /**
     * @brief 注册比较器
     * @throw checker_error 比较器名称为空或者已经被注册
     */
    void add(checker_ptr &&c);

    /**
     * @brief 根据名称查找比较器
     * @param name 比较器名称，为空时返回默认比较器
     * @throw checker_error 比较器不存在
     */
    const checker &resolve(const std::string &name) const;

    bool contains(const std::string &name) const;

    std::vector<std::string> names() const;

    /**
     * @brief 包含所有内置比较器的注册表，第一次调用时构建
     */
    static const checker_registry &builtin();

private:
    std::map<std::string, checker_ptr> checkers;
};

/**
 * @brief 将所有内置比较器注册进 registry
 */
void register_builtin_checkers(checker_registry &registry);

/**
 * @brief 规范化程序输出
 * 1. 将 CRLF 换行转换为 LF
 * 2. 删除每行末尾的空白字符
 * 3. 删除文末的空行
 */
std::string normalize_output(const std::string &output);

/**
 * @brief 将规范化后的输出按行拆分，空输出得到空列表
 */
std::vector<std::string> split_lines(const std::string &normalized);

/**
 * @brief 按空白字符拆分 token，忽略连续的空白
 */
std::vector<std::string> split_tokens(const std::string &text);

}  // namespace grader
