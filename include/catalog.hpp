#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "checker/checker.hpp"

/**
 * 题目目录
 * 题目列表保存在 catalog.json 中：
 * {
 *     "problems": [
 *         {
 *             "id": "sum_pairs",
 *             "description": "...",
 *             "difficulty": "easy",
 *             "time_limit_seconds": 2,
 *             "memory_limit_mb": 256, // 可选，默认 256
 *             "checker": "exact"      // 可选，默认 exact
 *         }
 *     ]
 * }
 * 题目目录在进程启动时加载一次，之后只读。
 */
namespace grader {

/**
 * @brief 描述一道题目
 */
struct problem_spec {
    /**
     * @brief 题目 id，同时也是测试数据的目录名，因此不能包含 "/" 或者 ".."
     */
    std::string id;

    std::string description;

    /**
     * @brief 难度标签，比如 easy、medium、hard，评测时不使用
     */
    std::string difficulty;

    /**
     * @brief 每个测试点的时间限制，单位为秒，必须为正数
     */
    double time_limit_seconds = 0;

    /**
     * @brief 内存限制，单位为 MB
     */
    int memory_limit_mb = 256;

    /**
     * @brief 比较器名称，为空时使用默认比较器
     */
    std::string checker;
};

void from_json(const nlohmann::json &j, problem_spec &spec);

void to_json(nlohmann::json &j, const problem_spec &spec);

struct catalog {
    catalog() = default;

    /**
     * @brief 解析并校验题目目录
     * @param registry 用于校验每道题的比较器是否存在
     * @throw catalog_error 题目 id 重复或不合法、时间或内存限制不合法、比较器不存在
     */
    static catalog parse(const nlohmann::json &j, const checker_registry &registry);

    /**
     * @brief 从 catalog.json 文件中加载题目目录
     * @throw catalog_error 文件不存在、不是合法的 JSON 或者校验失败
     */
    static catalog load(const std::filesystem::path &file, const checker_registry &registry);

    /**
     * @brief 根据 id 查找题目
     * @throw catalog_error 题目不存在
     */
    const problem_spec &find(const std::string &id) const;

    bool contains(const std::string &id) const;

    const std::vector<problem_spec> &problems() const;

private:
    std::vector<problem_spec> specs;
    std::map<std::string, std::size_t> index;
};

/**
 * @brief 进程内唯一的题目目录
 * 第一次调用时从 file 加载，之后的调用直接返回已加载的题目目录，忽略参数。
 * 多个线程同时调用时只会加载一次。加载失败时异常会抛给调用方，下一次调用会重新尝试加载。
 */
const catalog &load_global_catalog(const std::filesystem::path &file);

/**
 * @brief 列出测试数据目录中按编号命名的文件：1.txt, 2.txt, ..., N.txt
 * @param dir 测试数据目录
 * @return 按编号升序排列的文件路径
 * @throw catalog_error 目录不存在、存在无法识别的文件，或者编号不是从 1 开始连续的
 */
std::vector<std::filesystem::path> list_ordinal_files(const std::filesystem::path &dir);

}  // namespace grader
