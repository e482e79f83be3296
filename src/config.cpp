#include "config.hpp"

namespace grader {
using namespace std;

filesystem::path PROBLEMS_DIR = "/problems";
filesystem::path GRADING_DIR = "/grading";
filesystem::path RUN_DIR = "/tmp/grader";
filesystem::path RUNGUARD;
string RUN_USER;
string RUN_GROUP;
double COMPILE_TIME_LIMIT = 30;   // 30s
int COMPILE_MEMORY_LIMIT = -1;
int STREAM_SIZE_LIMIT = 1 << 16;  // 64M
int FILE_SIZE_LIMIT = 1 << 16;    // 64M
int STDERR_REPORT_LIMIT = 4096;
int PROC_LIMIT = -1;
string CXX_COMPILER = "g++";
vector<string> CXX_FLAGS = {"-O2", "-std=c++17"};
string PYTHON_INTERPRETER = "python3";
string ANSWER_SERVICE_HOST = "127.0.0.1";
int ANSWER_SERVICE_PORT = 5000;
int ANSWER_SERVICE_TIMEOUT_MS = 5000;
int ANSWER_SERVICE_STARTUP_MS = 30000;
bool DEBUG = false;

}  // namespace grader
