#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include "catalog.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "judge/orchestrator.hpp"
#include "service/answer_client.hpp"
using namespace std;

static void print_verdict(const grader::verdict &v) {
    nlohmann::json j = v;
    cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path repo_dir(filesystem::weakly_canonical(current).parent_path().parent_path());

    // 默认情况下，假设运行环境是拉取代码直接编译的环境，此时我们可以假定 runguard 的运行路径
    if (!getenv("RUNGUARD")) {
        for (auto &runguard : {repo_dir / "runguard" / "bin" / "runguard", current.parent_path() / "runguard"}) {
            if (filesystem::exists(runguard)) {
                setenv("RUNGUARD", filesystem::weakly_canonical(runguard).c_str(), 1);
                break;
            }
        }
    }

    namespace po = boost::program_options;
    po::options_description desc("grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("problem", po::value<string>(), "id of the problem to grade, must be listed in the catalog")
        ("source", po::value<string>(), "path of the solution file, language is detected from the extension")
        ("workdir", po::value<string>(), "directory containing <problem>.cpp or <problem>.py, used when --source is not given")
        ("catalog", po::value<string>(), "path of catalog.json, default to <problems-dir>/catalog.json")
        ("problems-dir", po::value<string>(), "set the directory with catalog and test inputs. You can either pass it from environ PROBLEMSDIR")
        ("run-dir", po::value<string>(), "set the directory to compile and run submissions. You can either pass it from environ RUNDIR")
        ("runguard", po::value<string>(), "set the location of runguard executable. You can either pass it from environ RUNGUARD")
        ("run-user", po::value<string>(), "set run user. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set run group. You can either pass it from environ RUNGROUP")
        ("host", po::value<string>(), "set the loopback address of answer service. You can either pass it from environ GRADING_HOST")
        ("port", po::value<int>(), "set the port of answer service. You can either pass it from environ GRADING_PORT")
        ("timeout", po::value<int>(), "set the timeout in milliseconds of each answer service request, default to 5000")
        ("startup-wait", po::value<int>(), "set how long in milliseconds to wait for answer service to become ready, default to 30000")
        ("compile-time-limit", po::value<double>(), "set the wall time limit in seconds of compilation, default to 30")
        ("debug", "turn on the debug mode to allow running submissions as root, and not to delete run directory to check the validity of result files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader: compile a solution, run it against every test case of a problem and print the verdict as JSON" << endl
             << "Requires a running answer-server to compare outputs" << endl
             << "Required Environment Variables:" << endl
             << "\tRUNGUARD: location of runguard" << endl
             << "Usage: " << argv[0] << " --problem <id> (--source <file> | --workdir <dir>) [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "oi-grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("problem") || (!vm.count("source") && !vm.count("workdir"))) {
        cerr << "--problem and one of --source, --workdir are required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        grader::DEBUG = true;
    }

    if (vm.count("runguard")) {
        grader::RUNGUARD = filesystem::path(vm.at("runguard").as<string>());
    } else if (getenv("RUNGUARD")) {
        grader::RUNGUARD = filesystem::path(getenv("RUNGUARD"));
    }
    CHECK(filesystem::is_regular_file(grader::RUNGUARD))
        << "RUNGUARD environment variable should be specified. This env points out where the runguard executable locates in.";

    if (vm.count("problems-dir")) {
        grader::PROBLEMS_DIR = filesystem::path(vm.at("problems-dir").as<string>());
    } else if (getenv("PROBLEMSDIR")) {
        grader::PROBLEMS_DIR = filesystem::path(getenv("PROBLEMSDIR"));
    }
    CHECK(filesystem::is_directory(grader::PROBLEMS_DIR))
        << "Problems directory " << grader::PROBLEMS_DIR << " does not exist";

    if (vm.count("run-dir")) {
        grader::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        grader::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    filesystem::create_directories(grader::RUN_DIR);
    // runguard 会切换到运行目录，传给它的路径必须是绝对路径
    grader::RUN_DIR = filesystem::absolute(grader::RUN_DIR);

    if (vm.count("run-user")) {
        grader::RUN_USER = vm["run-user"].as<string>();
    } else if (getenv("RUNUSER")) {
        grader::RUN_USER = getenv("RUNUSER");
    }

    if (vm.count("run-group")) {
        grader::RUN_GROUP = vm["run-group"].as<string>();
    } else if (getenv("RUNGROUP")) {
        grader::RUN_GROUP = getenv("RUNGROUP");
    }

    if (getuid() == 0 && grader::RUN_USER.empty()) {
        cerr << "Refusing to run submissions as root, specify --run-user or enable debug mode" << endl;
        if (!grader::DEBUG) return EXIT_FAILURE;
    }

    if (vm.count("host")) {
        grader::ANSWER_SERVICE_HOST = vm["host"].as<string>();
    } else if (getenv("GRADING_HOST")) {
        grader::ANSWER_SERVICE_HOST = getenv("GRADING_HOST");
    }

    if (vm.count("port")) {
        grader::ANSWER_SERVICE_PORT = vm["port"].as<int>();
    } else if (getenv("GRADING_PORT")) {
        grader::ANSWER_SERVICE_PORT = boost::lexical_cast<int>(getenv("GRADING_PORT"));
    }

    if (vm.count("timeout")) {
        grader::ANSWER_SERVICE_TIMEOUT_MS = vm["timeout"].as<int>();
    }

    if (vm.count("startup-wait")) {
        grader::ANSWER_SERVICE_STARTUP_MS = vm["startup-wait"].as<int>();
    }

    if (vm.count("compile-time-limit")) {
        grader::COMPILE_TIME_LIMIT = vm["compile-time-limit"].as<double>();
    }

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    filesystem::path catalog_file = vm.count("catalog")
                                        ? filesystem::path(vm["catalog"].as<string>())
                                        : grader::PROBLEMS_DIR / "catalog.json";

    const grader::catalog *problems;
    try {
        problems = &grader::load_global_catalog(catalog_file);
    } catch (grader::catalog_error &e) {
        LOG(ERROR) << "Unable to load catalog " << catalog_file << ": " << e.what();
        return EXIT_FAILURE;
    }

    grader::grading_request request;
    request.problem_id = vm["problem"].as<string>();
    if (vm.count("source")) request.source = vm["source"].as<string>();
    if (vm.count("workdir")) request.workdir = vm["workdir"].as<string>();

    if (!problems->contains(request.problem_id)) {
        LOG(ERROR) << "Problem " << request.problem_id << " is not in catalog " << catalog_file;
        return EXIT_FAILURE;
    }

    grader::tcp_answer_client client(grader::ANSWER_SERVICE_HOST, grader::ANSWER_SERVICE_PORT,
                                     chrono::milliseconds(grader::ANSWER_SERVICE_TIMEOUT_MS));
    try {
        grader::wait_until_ready(client, chrono::milliseconds(grader::ANSWER_SERVICE_STARTUP_MS));
    } catch (grader::infra_error &e) {
        LOG(ERROR) << "Answer service is unavailable: " << e.what();
        print_verdict(grader::verdict::infra_error(e.what()));
        return EXIT_SUCCESS;
    }

    grader::orchestrator judge(*problems, client, grader::PROBLEMS_DIR, grader::RUN_DIR);
    try {
        print_verdict(judge.grade(request));
    } catch (grader::catalog_error &e) {
        LOG(ERROR) << "Problem " << request.problem_id << " is misconfigured: " << e.what();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
