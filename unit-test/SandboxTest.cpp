#include <unistd.h>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <thread>
#include "common/defer.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/compiler.hpp"
#include "judge/sandbox.hpp"

using namespace std;
using namespace grader;
namespace fs = std::filesystem;

class SandboxTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = RUN_DIR / "sandbox";
        reset_directory(dir);
        write_file_content(dir / "input.txt", "1 2\n3 4\n");
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    compiled_artifact build(const string &filename, const string &source) {
        write_file_content(dir / filename, source);
        return compile(make_submission("sandbox", dir / filename), dir / "compile", dir / "bin");
    }

    execution_result run(const compiled_artifact &artifact, double time_limit = 1, int memory_limit_mb = 256) {
        return run_test_case(artifact, dir / "input.txt", time_limit, memory_limit_mb, dir / "run");
    }
};

TEST_F(SandboxTest, StdinStdoutTest) {
    auto artifact = build("main.cpp", R"(#include <iostream>
int main() {
    long long a, b;
    while (std::cin >> a >> b) std::cout << a + b << std::endl;
    std::cerr << "done" << std::endl;
    return 0;
})");
    EXPECT_EQ(artifact.lang, language::CPP);

    auto result = run(artifact);
    EXPECT_EQ(result.status, execution_status::OK);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data, "3\n7\n");
    EXPECT_EQ(result.stderr_data, "done\n");
    EXPECT_FALSE(result.output_truncated);
    EXPECT_GE(result.wall_time_ms, 0);
    EXPECT_GT(result.memory_bytes, 0);
}

TEST_F(SandboxTest, TimeoutTest) {
    auto artifact = build("main.cpp", R"(int main() {
    volatile unsigned long long x = 0;
    while (true) ++x;
})");

    auto begin = chrono::steady_clock::now();
    auto result = run(artifact, 1);
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - begin).count();

    EXPECT_EQ(result.status, execution_status::TIMEOUT);
    EXPECT_GE(result.wall_time_ms, 900);
    EXPECT_LT(result.wall_time_ms, 2000);
    // 超时后必须立即杀死程序，而不是等待程序自己结束
    EXPECT_LT(elapsed, 2000);
}

TEST_F(SandboxTest, SleepTimeoutTest) {
    // 不占用 CPU 的程序也会受到墙上时间的限制
    auto artifact = build("main.cpp", R"(#include <unistd.h>
int main() {
    sleep(30);
    return 0;
})");

    auto begin = chrono::steady_clock::now();
    auto result = run(artifact, 1);
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - begin).count();

    EXPECT_EQ(result.status, execution_status::TIMEOUT);
    EXPECT_LT(result.wall_time_ms, 2000);
    EXPECT_LT(elapsed, 2000);
}

TEST_F(SandboxTest, NonZeroExitCodeTest) {
    auto artifact = build("main.cpp", R"(#include <cstdio>
int main() {
    printf("partial\n");
    return 3;
})");

    auto result = run(artifact);
    EXPECT_EQ(result.status, execution_status::RUNTIME_ERROR);
    EXPECT_EQ(result.exit_code, 3);
    // 运行错误时输出依然被保留
    EXPECT_EQ(result.stdout_data, "partial\n");
}

TEST_F(SandboxTest, SegmentationFaultTest) {
    auto artifact = build("main.cpp", R"(int main() {
    volatile int *p = nullptr;
    *p = 1;
    return 0;
})");

    auto result = run(artifact);
    EXPECT_EQ(result.status, execution_status::RUNTIME_ERROR);
    EXPECT_EQ(result.signal, SIGSEGV);
}

TEST_F(SandboxTest, MemoryLimitTest) {
    auto artifact = build("main.cpp", R"(#include <cstdlib>
#include <cstring>
int main() {
    char *p = (char *)malloc(512u << 20);
    if (!p) return 1;
    memset(p, 1, 512u << 20);
    return p[12345] == 1 ? 0 : 2;
})");

    auto result = run(artifact, 2, 64);
    EXPECT_EQ(result.status, execution_status::RUNTIME_ERROR);
}

TEST_F(SandboxTest, DeepRecursionTest) {
    // 栈空间不受限制，只受内存限制
    auto artifact = build("main.cpp", R"(#include <cstdio>
int depth(int n) {
    volatile char buffer[64];
    buffer[0] = (char)n;
    return n == 0 ? buffer[0] : depth(n - 1) + 1;
}
int main() {
    printf("%d\n", depth(1000000));
    return 0;
})");

    auto result = run(artifact, 2, 512);
    EXPECT_EQ(result.status, execution_status::OK);
    EXPECT_EQ(result.stdout_data, "1000000\n");
}

TEST_F(SandboxTest, ProcessTreeKilledTest) {
    fs::path marker = fs::temp_directory_path() / ("grader-orphan-" + to_string(getpid()));
    fs::remove(marker);

    // 父进程立即退出，留下的子进程在 2 秒后写入标记文件
    auto artifact = build("main.cpp", R"(#include <fstream>
#include <unistd.h>
int main() {
    if (fork() == 0) {
        sleep(2);
        std::ofstream(")" + marker.string() + R"(") << "escaped";
        return 0;
    }
    return 0;
})");

    auto result = run(artifact);
    EXPECT_EQ(result.status, execution_status::OK);

    this_thread::sleep_for(chrono::seconds(3));
    EXPECT_FALSE(fs::exists(marker));
    fs::remove(marker);
}

TEST_F(SandboxTest, ProcessTreeKilledOnTimeoutTest) {
    fs::path marker = fs::temp_directory_path() / ("grader-orphan-timeout-" + to_string(getpid()));
    fs::remove(marker);

    auto artifact = build("main.cpp", R"(#include <fstream>
#include <unistd.h>
int main() {
    if (fork() == 0) {
        sleep(2);
        std::ofstream(")" + marker.string() + R"(") << "escaped";
        return 0;
    }
    while (true) pause();
})");

    auto result = run(artifact, 1);
    EXPECT_EQ(result.status, execution_status::TIMEOUT);

    this_thread::sleep_for(chrono::seconds(2));
    EXPECT_FALSE(fs::exists(marker));
    fs::remove(marker);
}

TEST_F(SandboxTest, OutputTruncatedTest) {
    int previous = STREAM_SIZE_LIMIT;
    STREAM_SIZE_LIMIT = 4;  // 4 KB
    defer { STREAM_SIZE_LIMIT = previous; };

    auto artifact = build("main.cpp", R"(#include <cstdio>
int main() {
    for (int i = 0; i < 100000; ++i) puts("0123456789");
    return 0;
})");
    auto result = run(artifact);

    EXPECT_EQ(result.status, execution_status::OK);
    EXPECT_TRUE(result.output_truncated);
    EXPECT_EQ(result.stdout_data.size(), 4096);
}

TEST_F(SandboxTest, FileSizeLimitTest) {
    int previous = FILE_SIZE_LIMIT;
    FILE_SIZE_LIMIT = 64;  // 64 KB
    defer { FILE_SIZE_LIMIT = previous; };

    auto artifact = build("main.cpp", R"(#include <cstdio>
#include <iostream>
int main() {
    FILE *f = fopen("big.txt", "w");
    if (!f) return 0;
    for (int i = 0; i < 100000; ++i) fputs("0123456789", f);
    fclose(f);
    std::cout << "written" << std::endl;
    return 0;
})");
    auto result = run(artifact);

    // 超出文件大小限制时收到 SIGXFSZ
    EXPECT_EQ(result.status, execution_status::RUNTIME_ERROR);
    EXPECT_EQ(result.stdout_data, "");
}

TEST_F(SandboxTest, NoStateSharedBetweenTestCasesTest) {
    // 每次运行都尝试在工作目录和编译目录中留下文件，并报告上一次运行留下的文件
    auto artifact = build("main.cpp", R"(#include <cstdio>
int main() {
    const char *paths[] = {"state", "../compile/state"};
    for (const char *path : paths) {
        FILE *f = fopen(path, "r");
        printf("%s\n", f ? "leaked" : "clean");
        if (f) fclose(f);
        f = fopen(path, "a");
        if (f) {
            fputs("x", f);
            fclose(f);
        }
    }
    return 0;
})");
    EXPECT_FALSE(fs::exists(dir / "compile"));

    auto first = run(artifact);
    auto second = run(artifact);
    EXPECT_EQ(first.stdout_data, "clean\nclean\n");
    EXPECT_EQ(second.stdout_data, "clean\nclean\n");
}

TEST_F(SandboxTest, ArtifactReadOnlyTest) {
    auto artifact = build("main.cpp", "int main() { return 0; }");
    ASSERT_EQ(artifact.command.size(), 1);

    fs::path program(artifact.command[0]);
    EXPECT_EQ(program.parent_path(), dir / "bin");
    auto writable = fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write;
    EXPECT_EQ(fs::status(program).permissions() & writable, fs::perms::none);
    EXPECT_EQ(fs::status(dir / "bin").permissions() & (fs::perms::group_write | fs::perms::others_write), fs::perms::none);

    write_file_content(dir / "main.py", "print(1)\n");
    auto script = compile(make_submission("sandbox", dir / "main.py"), dir / "compile", dir / "bin");
    ASSERT_EQ(script.command.size(), 2);
    EXPECT_EQ(fs::path(script.command[1]).parent_path(), dir / "bin");
    EXPECT_EQ(fs::status(script.command[1]).permissions() & writable, fs::perms::none);
}

TEST_F(SandboxTest, CompileErrorTest) {
    try {
        build("main.cpp", "int main() { return undefined_symbol; }");
        FAIL() << "compilation should fail";
    } catch (compilation_error &e) {
        EXPECT_NE(e.error_log.find("undefined_symbol"), string::npos) << e.error_log;
    }
}

TEST_F(SandboxTest, CompileTimeLimitTest) {
    double previous = COMPILE_TIME_LIMIT;
    COMPILE_TIME_LIMIT = 1;
    defer { COMPILE_TIME_LIMIT = previous; };

    auto begin = chrono::steady_clock::now();
    // 预处理器会一直读取 /dev/random
    EXPECT_THROW(build("main.cpp", R"(#include </dev/random>
int main() {
    return 0;
})"), compilation_error);
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - begin).count();
    EXPECT_LT(elapsed, 5000);
}

TEST_F(SandboxTest, UnsupportedLanguageTest) {
    write_file_content(dir / "main.rs", "fn main() {}");
    try {
        make_submission("sandbox", dir / "main.rs");
        FAIL() << "rust should not be supported";
    } catch (compilation_error &e) {
        EXPECT_NE(e.error_log.find(".rs"), string::npos) << e.error_log;
    }
}

TEST_F(SandboxTest, LocateSubmissionTest) {
    write_file_content(dir / "sum_pairs.py", "print(1)");
    EXPECT_EQ(locate_submission("sum_pairs", dir).lang, language::PYTHON);

    write_file_content(dir / "sum_pairs.cpp", "int main() {}");
    EXPECT_EQ(locate_submission("sum_pairs", dir).lang, language::CPP);

    try {
        locate_submission("max_subarray", dir);
        FAIL() << "no solution should be found";
    } catch (compilation_error &e) {
        EXPECT_NE(e.error_log.find("max_subarray.cpp"), string::npos);
        EXPECT_NE(e.error_log.find("max_subarray.py"), string::npos);
    }
}

TEST_F(SandboxTest, PythonTest) {
    auto artifact = build("main.py", R"(import sys
for line in sys.stdin:
    a, b = map(int, line.split())
    print(a + b)
)");
    EXPECT_EQ(artifact.lang, language::PYTHON);

    auto result = run(artifact, 5);
    EXPECT_EQ(result.status, execution_status::OK);
    EXPECT_EQ(result.stdout_data, "3\n7\n");
}
