#pragma once

#include "runguard_options.hpp"

/**
 * @brief 将 runguard 及之后创建的子进程移入新的命名空间
 * 隔离网络命名空间后，选手程序无法访问主机的回环地址，
 * 因此也无法直接连接 answer service。
 * @return 是否隔离成功，非 root 用户通常会失败
 */
bool isolate_namespaces(const struct runguard_options &opt);

/**
 * @brief 限制当前进程的资源使用，并切换到受限用户，在子进程 exec 前调用
 */
void set_restrictions(const struct runguard_options &opt);
