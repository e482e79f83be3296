#pragma once

#include "runguard_options.hpp"

/**
 * @brief 根据传入的设置运行指定的程序
 * @note 该函数必须在 main 函数最后调用，或者 fork 出一个新进程再调用本函数
 * 1. 注册 SIGCHLD 来监听子进程的信号
 * 2. 分离 IPC、NET、UTS 等命名空间，避免选手程序访问主机网络（比如 answer service）
 * 3. 调用 fork 创建子进程，并等待子进程结束
 *    1. 对于父进程
 *       1. 创建 itimer 来限制 wall time，在遇到 SIGALRM 时终止整个进程组并记录信息到 meta 文件中
 *       2. 与子进程建立管道连接，将输出写入文件，超过 stream_size 的部分被丢弃
 *       3. 等待子进程结束
 *    2. 对于子进程，添加资源限制，并与父进程建立管道重定向输入输出
 *       1. 必要时清除 PATH 以外的环境变量
 *       2. 通过 rlimit 限制 CPU time、地址空间、文件大小、进程数，并给予无限大的栈空间
 *       3. 将子进程分离到一个独立的进程组，以便我们通过 SIGKILL 可以杀死进程组内所有进程
 *       4. 切换到工作路径
 *       5. 设置子进程的 user 和 group 以允许文件访问权限限制
 * 4. 子进程结束后立刻杀死进程组内的所有进程，确保选手 fork 出来的子进程都不会留驻系统
 * 5. 检查子进程是否正常退出
 *     1. 若因为信号终止，且为 SIGXCPU 则超时，否则为运行错误
 *     2. 若因为信号停止，返回运行错误
 * 6. 记录运行时间、内存使用、输出大小等信息到 meta 文件中
 * @return 被运行程序的返回值，因信号终止时为 128 + 信号值
 */
int runit(struct runguard_options opt);
