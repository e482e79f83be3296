#include "judge/compiler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

/**
 * @brief 将编译结果复制到 artifact_dir
 * 复制出的文件属于评测进程所在用户，选手用户只能读取或者执行
 */
static fs::path install_artifact(const fs::path &file, const fs::path &artifact_dir, fs::perms mode) {
    fs::path target = artifact_dir / file.filename();
    fs::copy_file(file, target, fs::copy_options::overwrite_existing);
    fs::permissions(target, mode);
    return target;
}

static compiled_artifact compile_cpp(const submission &submit, const fs::path &compile_dir, const fs::path &artifact_dir) {
    reset_directory(compile_dir);
    if (!RUN_USER.empty())
        fs::permissions(compile_dir, fs::perms::all);
    // 编译器以选手用户运行，编译目录对选手程序可写，运行测试点之前必须删除
    defer {
        error_code ec;
        fs::remove_all(compile_dir, ec);
    };

    fs::path source = compile_dir / ("main" + submit.source.extension().string());
    fs::path executable = compile_dir / "program";
    fs::copy_file(submit.source, source, fs::copy_options::overwrite_existing);

    sandbox_options options;
    options.time_limit = COMPILE_TIME_LIMIT;
    options.memory_limit_mb = COMPILE_MEMORY_LIMIT;
    options.work_dir = compile_dir;
    options.stdout_file = compile_dir / "compile.out";
    options.stderr_file = options.stdout_file;
    options.meta_file = compile_dir / "compile.meta";
    options.preserve_env = true;

    vector<string> command = {CXX_COMPILER};
    command.insert(command.end(), CXX_FLAGS.begin(), CXX_FLAGS.end());
    command.insert(command.end(), {"-o", executable.string(), source.string()});

    runguard_result result = run_guarded(options, command);
    string log = read_file_prefix(options.stdout_file, (size_t)max(STREAM_SIZE_LIMIT, 0) * 1024);

    if (result.timed_out())
        throw compilation_error("Compilation time limit exceeded",
                                fmt::format("Compilation exceeded the time limit of {} seconds\n{}", COMPILE_TIME_LIMIT, log));
    if (result.exitcode != 0 || !fs::exists(executable))
        throw compilation_error("Compilation failed", log.empty() ? fmt::format("Compiler exited with code {}", result.exitcode) : log);

    LOG(INFO) << fmt::format("Compiled {} in {:.3f} s", submit.source.filename().string(), result.wall_time);

    compiled_artifact artifact;
    artifact.lang = submit.lang;
    artifact.command = {install_artifact(executable, artifact_dir, fs::perms::owner_read | fs::perms::owner_exec |
                                                                       fs::perms::group_read | fs::perms::group_exec |
                                                                       fs::perms::others_read | fs::perms::others_exec)
                            .string()};
    return artifact;
}

static compiled_artifact prepare_python(const submission &submit, const fs::path &artifact_dir) {
    fs::path source = artifact_dir / "main.py";
    fs::copy_file(submit.source, source, fs::copy_options::overwrite_existing);
    fs::permissions(source, fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read);

    compiled_artifact artifact;
    artifact.lang = submit.lang;
    artifact.command = {PYTHON_INTERPRETER, source.string()};
    return artifact;
}

compiled_artifact compile(const submission &submit, const fs::path &compile_dir, const fs::path &artifact_dir) {
    reset_directory(artifact_dir);
    fs::permissions(artifact_dir, fs::perms::owner_all |
                                      fs::perms::group_read | fs::perms::group_exec |
                                      fs::perms::others_read | fs::perms::others_exec);

    switch (submit.lang) {
        case language::CPP:
            return compile_cpp(submit, compile_dir, artifact_dir);
        case language::PYTHON:
            return prepare_python(submit, artifact_dir);
    }
    throw compilation_error("Unsupported language", "Unsupported language");
}

}  // namespace grader
