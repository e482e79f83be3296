#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

struct time_limit {
    double soft, hard;
};

struct runguard_options {
    std::string work_dir;
    size_t nproc = 0;    // 0 表示不限制
    int user_id = -1;
    int group_id = -1;

    bool use_wall_limit = false;
    struct time_limit wall_limit;  // wall clock time
    bool use_cpu_limit = false;
    struct time_limit cpu_limit;  // CPU time

    int64_t memory_limit = -1;  // 地址空间限制，单位为字节
    int64_t file_limit = -1;    // 单个文件的最大大小，单位为字节
    int64_t stream_size = -1;   // stdout、stderr 的最大保存大小，单位为字节
    bool no_core_dumps = false;

    /**
     * @brief 是否将选手程序与主机网络隔离
     * 需要 root 权限，没有权限时只会输出警告
     */
    bool isolate = true;

    /**
     * @brief 是否允许以 root 身份运行选手程序，只用于调试
     */
    bool allow_root = false;

    std::string stdin_filename;
    std::string stdout_filename;
    std::string stderr_filename;

    bool preserve_sys_env = false;

    std::string metafile_path;
    std::vector<std::string> command;
};
