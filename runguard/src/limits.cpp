#include "limits.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <math.h>
#include <sched.h>
#include <string.h>
#include <sys/resource.h>
#include <unistd.h>
#include <system_error>

using namespace std;

bool isolate_namespaces(const struct runguard_options &opt) {
    if (!opt.isolate) return false;

    /*
     * CLONE_NEWNET：隔离网络命名空间，选手程序只能看到一个没有启用的回环网卡，
     *              因此无法连接 answer service 或者访问外部网络
     * CLONE_NEWIPC：隔离 IPC 命名空间，选手程序无法通过 System V IPC 与主机程序通信
     * CLONE_NEWUTS: 隔离 hostname 和 NIS
     * CLONE_FILES：不与调用方共享文件描述符表
     */
    if (unshare(CLONE_FILES | CLONE_NEWIPC | CLONE_NEWNET | CLONE_NEWUTS) != 0) {
        LOG(WARNING) << "unable to unshare namespaces, network is not isolated: " << strerror(errno);
        return false;
    }
    return true;
}

static void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), fmt::format("setrlimit {}", resource));
}

void set_restrictions(const struct runguard_options &opt) {
    if (!opt.preserve_sys_env) {
        string path = getenv("PATH") ? getenv("PATH") : "";
        if (clearenv() != 0)
            throw system_error(errno, generic_category(), "unable to clear environment");
        if (!path.empty()) setenv("PATH", path.c_str(), true);
    }

    if (opt.use_cpu_limit) {
        /* Setting the real hard limit one second
		   higher: at the soft limit the kernel will send SIGXCPU at
		   the hard limit a SIGKILL. The SIGXCPU can be caught, but is
		   not by default and gives us a reliable way to detect if the
		   CPU-time limit was reached. */
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit.hard);
        set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }

    if (opt.memory_limit > 0)
        set_rlimit(RLIMIT_AS, opt.memory_limit, opt.memory_limit);
    else
        set_rlimit(RLIMIT_AS, RLIM_INFINITY, RLIM_INFINITY);

    // 递归较深的程序需要足够的栈空间
    set_rlimit(RLIMIT_STACK, RLIM_INFINITY, RLIM_INFINITY);

    if (opt.file_limit > 0) set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit + 1);
    if (opt.nproc > 0) set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc);
    if (opt.no_core_dumps) set_rlimit(RLIMIT_CORE, 0, 0);

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1)
        throw system_error(errno, generic_category(), "unable to setsid");

    if (!opt.work_dir.empty()) {
        if (chdir(opt.work_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chdir to {}", opt.work_dir));
    }

    if (opt.group_id >= 0) {
        if (setgid(opt.group_id))
            throw system_error(errno, generic_category(), "unable to set group id");
        gid_t aux_groups[1] = {(gid_t)opt.group_id};
        if (setgroups(1, aux_groups))
            throw system_error(errno, generic_category(), "unable to clear auxiliary groups");
    }

    if (opt.user_id >= 0) {
        if (setuid(opt.user_id))
            throw system_error(errno, generic_category(), "unable to set user id");
    }

    if (!opt.allow_root && (geteuid() == 0 || getuid() == 0))
        throw runtime_error("you cannot run user command as root");
}
