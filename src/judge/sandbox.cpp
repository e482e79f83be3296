#include "judge/sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <cerrno>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

/**
 * @brief 运行 runguard 并等待其退出
 * @return runguard 的返回值，被信号终止时返回 -1
 */
static int exec_runguard(const vector<string> &args) {
    vector<const char *> argv;
    argv.push_back(RUNGUARD.c_str());
    for (auto &arg : args)
        argv.push_back(arg.c_str());
    argv.push_back(nullptr);

    DLOG(INFO) << RUNGUARD.string() << ' ' << boost::algorithm::join(args, " ");

    pid_t pid = fork();
    if (pid < 0)
        throw system_error(errno, system_category(), "fork");
    if (pid == 0) {
        // 中断信号由评测进程处理，runguard 需要完成清理并写入 meta 文件
        signal(SIGINT, SIG_IGN);
        execv(argv[0], (char **)argv.data());
        _exit(EXIT_FAILURE);
    }

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), "waitpid");
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

runguard_result run_guarded(const sandbox_options &options, const vector<string> &command) {
    if (command.empty())
        throw internal_error("empty command");

    vector<string> args;
    args.push_back("--wall-time");
    args.push_back(fmt::format("{:.3f}", options.time_limit));
    args.push_back("--cpu-time");
    args.push_back(fmt::format("{:.3f}", options.time_limit));
    if (options.memory_limit_mb > 0) {
        args.push_back("--memory-limit");
        args.push_back(to_string((long long)options.memory_limit_mb * 1024));
    }
    if (STREAM_SIZE_LIMIT > 0) {
        args.push_back("--stream-size");
        args.push_back(to_string(STREAM_SIZE_LIMIT));
    }
    if (FILE_SIZE_LIMIT > 0) {
        args.push_back("--file-limit");
        args.push_back(to_string(FILE_SIZE_LIMIT));
    }
    if (PROC_LIMIT > 0) {
        args.push_back("--nproc");
        args.push_back(to_string(PROC_LIMIT));
    }
    if (!RUN_USER.empty()) {
        args.push_back("--user");
        args.push_back(RUN_USER);
        args.push_back("--group");
        args.push_back(RUN_GROUP.empty() ? RUN_USER : RUN_GROUP);
    }
    if (DEBUG) args.push_back("--allow-root");
    if (options.preserve_env) args.push_back("--environment");
    args.push_back("--no-core-dumps");
    args.push_back("--work-dir");
    args.push_back(options.work_dir.string());
    if (!options.stdin_file.empty()) {
        args.push_back("--standard-input-file");
        args.push_back(options.stdin_file.string());
    }
    args.push_back("--standard-output-file");
    args.push_back(options.stdout_file.string());
    args.push_back("--standard-error-file");
    args.push_back(options.stderr_file.string());
    args.push_back("--out-meta");
    args.push_back(options.meta_file.string());
    args.push_back("--");

    args.insert(args.end(), command.begin(), command.end());

    fs::remove(options.meta_file);
    int ret = exec_runguard(args);

    runguard_result result = read_runguard_result(options.meta_file);
    if (!result.internal_error.empty())
        throw internal_error(fmt::format("runguard failed with exitcode {}: {}", ret, result.internal_error));
    return result;
}

execution_result run_test_case(const compiled_artifact &artifact, const fs::path &input_file,
                               double time_limit, int memory_limit_mb, const fs::path &run_dir) {
    reset_directory(run_dir);
    if (!RUN_USER.empty())
        fs::permissions(run_dir, fs::perms::all);

    sandbox_options options;
    options.time_limit = time_limit;
    options.memory_limit_mb = memory_limit_mb;
    options.work_dir = run_dir;
    options.stdin_file = run_dir / "testdata.in";
    options.stdout_file = run_dir / "program.out";
    options.stderr_file = run_dir / "program.err";
    options.meta_file = run_dir / "program.meta";

    fs::copy_file(input_file, options.stdin_file, fs::copy_options::overwrite_existing);

    runguard_result meta = run_guarded(options, artifact.command);

    execution_result result;
    result.exit_code = meta.exitcode;
    result.signal = meta.signal;
    result.wall_time_ms = meta.wall_time * 1000;
    result.cpu_time_ms = meta.cpu_time * 1000;
    result.memory_bytes = meta.memory;
    result.output_truncated = !meta.output_truncated.empty();

    if (meta.timed_out())
        result.status = execution_status::TIMEOUT;
    else if (meta.exitcode != 0)
        result.status = execution_status::RUNTIME_ERROR;
    else
        result.status = execution_status::OK;

    size_t limit = (size_t)max(STREAM_SIZE_LIMIT, 0) * 1024;
    result.stdout_data = read_file_prefix(options.stdout_file, limit);
    result.stderr_data = read_file_prefix(options.stderr_file, limit);

    DLOG(INFO) << fmt::format("Test case finished: {} in {:.0f} ms, exitcode {}", get_display_message(result.status), result.wall_time_ms, result.exit_code);
    return result;
}

}  // namespace grader
