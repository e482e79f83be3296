#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的前 limit 个字节
 * 选手程序的输出可能非常大，读取时需要截断
 */
std::string read_file_prefix(const std::filesystem::path &path, std::size_t limit);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，题目 id 会被
 * 直接拼接进测试数据路径，如果拿到的 id 包含 "../" 或者 "/"，
 * 那么选手就有可能让评测系统读取到其他目录下的文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 清空文件夹，文件夹不存在时创建
 * 用于在测试点之间重置选手程序的运行目录，避免测试点之间互相影响
 */
void reset_directory(const std::filesystem::path &dir);

struct scoped_file_lock {
    scoped_file_lock();
    scoped_file_lock(const std::filesystem::path &path, bool shared);
    scoped_file_lock(scoped_file_lock &&);
    ~scoped_file_lock();

    scoped_file_lock &operator=(scoped_file_lock &&);

    std::filesystem::path file() const;

    void release();
private:
    int fd = -1;
    bool valid = false;
    std::filesystem::path lock_file;
};

/**
 * @brief 锁文件夹
 * 通过创建文件夹，并对文件夹根目录下的 .lock 文件加锁实现
 * @param dir 要被加锁的文件夹
 * @param shared 是否是共享锁，真为共享锁（读锁），假为独占锁（写锁）
 * @return 文件锁
 */
scoped_file_lock lock_directory(const std::filesystem::path &dir, bool shared);

}  // namespace grader
