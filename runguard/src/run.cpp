#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <math.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <sys/time.h>
#include <sys/times.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/assign.hpp>
#include <fstream>
#include <iostream>
#include <system_error>
#include "limits.hpp"
#include "runguard_options.hpp"

using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

const int TIMELIMIT_SOFT = 1;
const int TIMELIMIT_HARD = 2;
int walllimit = 0, cpulimit = 0;

ofstream metafile;
int child_pid = -1;
static volatile sig_atomic_t received_SIGCHLD = 0;
static volatile sig_atomic_t received_signal = -1;

template <typename... Args>
[[noreturn]] void error(int err, const char *format, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(fmt::runtime(format), args...));
}

template <typename T>
void append_meta(const char *key, T message) {
    if (!metafile) return;
    metafile << key << ": " << message << endl;
}

/**
 * @brief 杀死选手程序所在进程组的所有进程
 * 选手程序在 setsid 之后成为进程组组长，进程组 id 即为 child_pid
 */
static void kill_process_group(int sig) {
    if (child_pid <= 0) return;
    if (kill(-child_pid, sig) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send signal " << sig << " to process group " << child_pid << ": " << strerror(errno);
}

static void runguard_terminate_handler() {
    sigset_t sigs;
    /*
	 * Make sure the signal handler for these (terminate()) does not
	 * interfere, we are exiting now anyway.
	 */
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGALRM);
    sigaddset(&sigs, SIGTERM);
    sigprocmask(SIG_BLOCK, &sigs, nullptr);

    exception_ptr cur = current_exception();
    if (cur) {
        try {
            rethrow_exception(cur);
        } catch (const exception &e) {
            cerr << e.what() << endl;
            append_meta("internal-error", e.what());
        }
    }

    /* Make sure that all children are killed before terminating */
    if (child_pid > 0) {
        LOG(INFO) << "sending SIGKILL";
        kill_process_group(SIGKILL);

        /* Wait a while to make sure the process is killed by now. */
        nanosleep(&killdelay, nullptr);
    }

    metafile.flush();
    _exit(EXIT_FAILURE);
}

static void summarize(const runguard_options &opt, int exitcode,
                      struct timeval starttime, struct timeval endtime,
                      struct tms startticks, struct tms endticks,
                      size_t data_passed[3], size_t data_read[3]) {
    static const char output_timelimit_str[4][16] = {
        "",
        "soft-timelimit",
        "hard-timelimit",
        "hard-timelimit"};

    struct rusage usage;
    if (getrusage(RUSAGE_CHILDREN, &usage) != 0)
        error(errno, "getting resource usage of children");
    // ru_maxrss 单位为 KB
    append_meta("memory-bytes", (int64_t)usage.ru_maxrss * 1024);

    unsigned long tps = sysconf(_SC_CLK_TCK);
    append_meta("exitcode", exitcode);

    if (received_signal != -1) {
        append_meta("signal", received_signal);
    }

    double walldiff = (endtime.tv_sec - starttime.tv_sec) +
                      (endtime.tv_usec - starttime.tv_usec) * 1E-6;
    double userdiff = (double)(endticks.tms_cutime - startticks.tms_cutime) / tps;
    double sysdiff = (double)(endticks.tms_cstime - startticks.tms_cstime) / tps;
    double cpudiff = userdiff + sysdiff;

    append_meta("wall-time", fmt::format("{:.3f}", walldiff));
    append_meta("user-time", fmt::format("{:.3f}", userdiff));
    append_meta("sys-time", fmt::format("{:.3f}", sysdiff));
    append_meta("cpu-time", fmt::format("{:.3f}", cpudiff));

    LOG(INFO) << fmt::format("run time: real {:.3f}, user {:.3f}, sys {:.3f}", walldiff, userdiff, sysdiff);

    if (opt.use_wall_limit && walldiff > opt.wall_limit.soft) {
        walllimit |= TIMELIMIT_SOFT;
        LOG(WARNING) << "Time Limit Exceeded (soft wall time)";
    }

    if (opt.use_cpu_limit && cpudiff > opt.cpu_limit.soft) {
        cpulimit |= TIMELIMIT_SOFT;
        LOG(WARNING) << "Time Limit Exceeded (soft cpu time)";
    }

    append_meta("time-result", output_timelimit_str[walllimit | cpulimit]);

    if (opt.stream_size >= 0) {
        using namespace boost::assign;
        vector<string> output_truncated;
        if (data_passed[STDOUT_FILENO] < data_read[STDOUT_FILENO])
            output_truncated += "stdout";
        if (data_passed[STDERR_FILENO] < data_read[STDERR_FILENO])
            output_truncated += "stderr";
        append_meta("output-truncated", boost::algorithm::join(output_truncated, ","));
    }

    append_meta("stdout-bytes", data_read[STDOUT_FILENO]);
    append_meta("stderr-bytes", data_read[STDERR_FILENO]);
}

static void terminate_command(int sig) {
    struct sigaction sigact;

    /* Reset signal handlers to default */
    sigact.sa_handler = SIG_DFL;
    sigact.sa_flags = 0;
    sigemptyset(&sigact.sa_mask);
    sigaction(SIGTERM, &sigact, NULL);
    sigaction(SIGALRM, &sigact, NULL);

    if (sig == SIGALRM) {
        walllimit |= TIMELIMIT_HARD;
    }

    received_signal = sig;

    /* First try to kill graciously, then hard.
	   Don't report an already exited process as error. */
    kill(-child_pid, SIGTERM);

    /* Prefer nanosleep over sleep because of higher resolution and
	   it does not interfere with signals. */
    nanosleep(&killdelay, NULL);

    kill(-child_pid, SIGKILL);

    /* Wait another while to make sure the process is killed by now. */
    nanosleep(&killdelay, NULL);
}

static void child_handler(int /* signal */) {
    received_SIGCHLD = true;
}

static void pump_pipes(struct runguard_options &opt, fd_set *readfds, int child_pipefd[3][2], int child_redirfd[3], size_t data_read[], size_t data_passed[]) {
    char buf[BUF_SIZE];
    ssize_t nread, nwritten;
    size_t to_read, to_write;

    /* Check to see if data is available and pass it on */
    for (int i = 1; i <= 2; i++) {
        if (child_pipefd[i][PIPE_OUT] == -1 || !FD_ISSET(child_pipefd[i][PIPE_OUT], readfds))
            continue;

        if (opt.stream_size >= 0 && data_passed[i] == (size_t)opt.stream_size) {
            /* Throw away data if we're at the output limit, but
			   still count how much data we consumed  */
            nread = read(child_pipefd[i][PIPE_OUT], buf, BUF_SIZE);
        } else {
            /* Otherwise copy the output to a file */
            to_read = BUF_SIZE;
            if (opt.stream_size >= 0) {
                to_read = min((size_t)BUF_SIZE, (size_t)opt.stream_size - data_passed[i]);
            }

            nread = read(child_pipefd[i][PIPE_OUT], buf, to_read);
            if (nread > 0) {
                to_write = nread;
                char *ptr = buf;
                while (to_write > 0) {
                    nwritten = write(child_redirfd[i], ptr, to_write);
                    if (nwritten == -1) {
                        if (errno == EINTR) continue;
                        error(errno, "writing data of fd {}", i);
                    }
                    to_write -= nwritten;
                    ptr += nwritten;
                }
                data_passed[i] += nread;
            }

            /* print message if we're at the streamsize limit */
            if (opt.stream_size >= 0 && data_passed[i] == (size_t)opt.stream_size) {
                LOG(INFO) << "child fd " << i << " limit reached";
            }
        }
        if (nread == -1) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            error(errno, "copying data fd {}", i);
        }
        if (nread == 0) {
            /* EOF detected: close fd and indicate this with -1 */
            if (close(child_pipefd[i][PIPE_OUT]) != 0) {
                error(errno, "closing pipe for fd {}", i);
            }
            child_pipefd[i][PIPE_OUT] = -1;
            continue;
        }
        data_read[i] += nread;
    }
}

static void run_child(struct runguard_options &opt, int child_pipefd[3][2]) {
    if (!opt.stdin_filename.empty()) {
        int fd = open(opt.stdin_filename.c_str(), O_RDONLY);
        if (fd < 0) error(errno, "opening input file '{}'", opt.stdin_filename);
        if (dup2(fd, STDIN_FILENO) < 0) error(errno, "redirecting stdin");
        close(fd);
    }

    set_restrictions(opt);

    // 将管道连接到 stdout/stderr。
    for (int i = 1; i <= 2; ++i) {
        if (dup2(child_pipefd[i][PIPE_IN], i) < 0) {
            error(errno, "redirecting child fd {}", i);
        }
        if (close(child_pipefd[i][PIPE_IN]) != 0 ||
            close(child_pipefd[i][PIPE_OUT]) != 0) {
            error(errno, "closing pipe for fd {}", i);
        }
    }

    vector<char *> args;
    for (auto &arg : opt.command) args.push_back(arg.data());
    args.push_back(nullptr);

    execvp(args[0], args.data());
    error(errno, "unable to start command {}", opt.command[0]);
}

int runit(struct runguard_options opt) {
    set_terminate(runguard_terminate_handler);
    if (!opt.metafile_path.empty())
        metafile.open(opt.metafile_path.c_str(), ofstream::out);

    int child_pipefd[3][2];
    int child_redirfd[3];

    /* Setup pipes connecting to child stdout/err streams (ignore stdin). */
    for (int i = 1; i <= 2; i++) {
        if (pipe(child_pipefd[i]) != 0) error(errno, "creating pipe for fd {}", i);
    }

    sigset_t emptymask;
    if (sigemptyset(&emptymask) != 0) error(errno, "creating empty signal mask");

    {
        struct sigaction sigact;
        sigset_t sigmask;

        /* unmask all signals, except SIGCHLD: detected in pselect() below */
        sigmask = emptymask;
        if (sigaddset(&sigmask, SIGCHLD) != 0) error(errno, "setting signal mask");
        if (sigprocmask(SIG_SETMASK, &sigmask, NULL) != 0) {
            error(errno, "unmasking signals");
        }

        /* Construct signal handler for SIGCHLD detection in pselect(). */
        received_SIGCHLD = 0;
        sigact.sa_handler = child_handler;
        sigact.sa_flags = 0;
        sigact.sa_mask = emptymask;
        if (sigaction(SIGCHLD, &sigact, NULL) != 0) {
            error(errno, "installing signal handler");
        }
    }

    isolate_namespaces(opt);

    switch (child_pid = fork()) {
        case -1:
            error(errno, "unable to fork");
        case 0: {  // child process, run the command
            metafile.close();
            sigprocmask(SIG_SETMASK, &emptymask, NULL);
            try {
                run_child(opt, child_pipefd);
            } catch (const exception &e) {
                // 子进程无法写 meta 文件，只能通过 stderr 和返回值通知 watchdog
                cerr << e.what() << endl;
            }
            _exit(127);
        }
        default: {  // watchdog
            int status = 0, exitcode;
            struct tms startticks, endticks;
            struct timeval starttime, endtime;
            size_t data_read[3] = {0, 0, 0};
            size_t data_passed[3] = {0, 0, 0};
            size_t total_data;
            fd_set readfds;

            if (gettimeofday(&starttime, NULL))
                error(errno, "getting time");

            /* Close unused file descriptors */
            for (int i = 1; i <= 2; i++) {
                if (close(child_pipefd[i][PIPE_IN]) != 0) {
                    error(errno, "closing pipe for fd {}", i);
                }
            }

            /* Redirect child stdout/stderr to file */
            for (int i = 1; i <= 2; i++) {
                child_redirfd[i] = i; /* Default: no redirects */
            }
            if (!opt.stdout_filename.empty()) {
                child_redirfd[STDOUT_FILENO] = creat(opt.stdout_filename.c_str(), S_IRUSR | S_IWUSR);
                if (child_redirfd[STDOUT_FILENO] < 0) {
                    error(errno, "opening file '{}'", opt.stdout_filename);
                }
            }
            if (!opt.stderr_filename.empty()) {
                if (opt.stderr_filename == opt.stdout_filename) {
                    child_redirfd[STDERR_FILENO] = child_redirfd[STDOUT_FILENO];
                } else {
                    child_redirfd[STDERR_FILENO] = creat(opt.stderr_filename.c_str(), S_IRUSR | S_IWUSR);
                    if (child_redirfd[STDERR_FILENO] < 0) {
                        error(errno, "opening file '{}'", opt.stderr_filename);
                    }
                }
            }

            {
                sigset_t sigmask;
                struct sigaction sigact;

                /* Construct one-time signal handler to terminate() for TERM
		           and ALRM signals. */
                sigmask = emptymask;
                if (sigaddset(&sigmask, SIGALRM) != 0 || sigaddset(&sigmask, SIGTERM) != 0)
                    error(errno, "setting signal mask");

                sigact.sa_handler = terminate_command;
                sigact.sa_flags = SA_RESETHAND | SA_RESTART;
                sigact.sa_mask = sigmask;

                /* Kill child command when we receive SIGTERM */
                if (sigaction(SIGTERM, &sigact, NULL) != 0) {
                    error(errno, "installing signal handler");
                }

                if (opt.use_wall_limit) {
                    /* Kill child when we receive SIGALRM */
                    if (sigaction(SIGALRM, &sigact, NULL) != 0) {
                        error(errno, "installing signal handler");
                    }

                    double tmpd;
                    struct itimerval itimer;
                    /* Trigger SIGALRM via setitimer:  */
                    itimer.it_interval.tv_sec = 0;
                    itimer.it_interval.tv_usec = 0;
                    itimer.it_value.tv_sec = (int)opt.wall_limit.hard;
                    itimer.it_value.tv_usec = (int)(modf(opt.wall_limit.hard, &tmpd) * 1E6);

                    if (setitimer(ITIMER_REAL, &itimer, NULL) != 0) {
                        error(errno, "setting timer");
                    }
                    LOG(INFO) << fmt::format("setting hard wall-time limit to {:.3f} seconds", opt.wall_limit.hard);
                }
            }

            if (times(&startticks) == (clock_t)-1)
                error(errno, "getting start clock ticks");

            while (1) {
                FD_ZERO(&readfds);
                int nfds = -1;
                for (int i = 1; i <= 2; i++) {
                    if (child_pipefd[i][PIPE_OUT] >= 0) {
                        FD_SET(child_pipefd[i][PIPE_OUT], &readfds);
                        nfds = max(nfds, child_pipefd[i][PIPE_OUT]);
                    }
                }

                int r = pselect(nfds + 1, &readfds, NULL, NULL, NULL, &emptymask);
                if (r == -1 && errno != EINTR) error(errno, "waiting for child data");
                if (r == -1) FD_ZERO(&readfds);

                if (received_SIGCHLD || received_signal == SIGALRM) {
                    received_SIGCHLD = 0;
                    int pid = waitpid(child_pid, &status, WNOHANG);
                    if (pid < 0) error(errno, "waiting on child");
                    if (pid == child_pid) break;
                }

                pump_pipes(opt, &readfds, child_pipefd, child_redirfd, data_read, data_passed);
            }

            /* Disarm the timer, the command has finished. */
            if (opt.use_wall_limit) {
                struct itimerval itimer = {};
                setitimer(ITIMER_REAL, &itimer, NULL);
            }

            if (times(&endticks) == (clock_t)-1)
                error(errno, "getting end clock ticks");
            if (gettimeofday(&endtime, NULL))
                error(errno, "getting time");

            /* 主进程已经退出，杀死进程组内剩下的进程，否则它们可能一直持有输出管道 */
            kill_process_group(SIGKILL);

            /* Drain the remaining output without blocking. */
            FD_ZERO(&readfds);
            for (int i = 1; i <= 2; i++) {
                if (child_pipefd[i][PIPE_OUT] >= 0) {
                    FD_SET(child_pipefd[i][PIPE_OUT], &readfds);
                    int r = fcntl(child_pipefd[i][PIPE_OUT], F_GETFL);
                    if (r == -1) {
                        error(errno, "fcntl, getting flags");
                    }
                    r = fcntl(child_pipefd[i][PIPE_OUT], F_SETFL, r | O_NONBLOCK);
                    if (r == -1) {
                        error(errno, "fcntl, setting flags");
                    }
                }
            }

            do {
                total_data = data_read[1] + data_read[2];
                pump_pipes(opt, &readfds, child_pipefd, child_redirfd, data_read, data_passed);
            } while (data_read[1] + data_read[2] > total_data);

            /* Close the output files */
            if (child_redirfd[STDOUT_FILENO] != STDOUT_FILENO && close(child_redirfd[STDOUT_FILENO]) != 0)
                error(errno, "closing output fd {}", STDOUT_FILENO);
            if (child_redirfd[STDERR_FILENO] != STDERR_FILENO && child_redirfd[STDERR_FILENO] != child_redirfd[STDOUT_FILENO] &&
                close(child_redirfd[STDERR_FILENO]) != 0)
                error(errno, "closing output fd {}", STDERR_FILENO);

            if (WIFEXITED(status)) {
                exitcode = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                // In linux, exitcode is no larger than 127.
                int sig = WTERMSIG(status);
                if (received_signal == -1) received_signal = sig;
                exitcode = sig + 128;
                switch (sig) {
                    case SIGXCPU:
                        cpulimit |= TIMELIMIT_HARD;
                        LOG(WARNING) << "Time Limit Exceeded (hard cpu time)";
                        break;
                    default:
                        LOG(WARNING) << "Command terminated with signal (" << sig << ", " << strsignal(sig) << ")";
                        break;
                }
            } else if (WIFSTOPPED(status)) {
                received_signal = WSTOPSIG(status);
                exitcode = received_signal + 128;
                LOG(WARNING) << "Command stopped with signal (" << received_signal << ", " << strsignal(received_signal) << ")";
            } else {
                throw runtime_error(fmt::format("unknown status: {:x}", status));
            }

            if (walllimit & TIMELIMIT_HARD)
                LOG(WARNING) << "timelimit exceeded (hard wall time): command aborted";

            summarize(opt, exitcode, starttime, endtime, startticks, endticks, data_passed, data_read);

            return exitcode;
        }
    }
}
