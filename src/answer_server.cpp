#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include "catalog.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "service/answer_service.hpp"
using namespace std;

static atomic<bool> stopped(false);

void stopHandler(int /* signum */) {
    stopped = true;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("answer-server options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("catalog", po::value<string>(), "path of catalog.json, default to <problems-dir>/catalog.json")
        ("problems-dir", po::value<string>(), "set the directory with catalog.json. You can either pass it from environ PROBLEMSDIR")
        ("grading-dir", po::value<string>(), "set the protected directory with test inputs and expected outputs. You can either pass it from environ GRADINGDIR")
        ("host", po::value<string>(), "set the loopback address to listen on, default to 127.0.0.1. You can either pass it from environ GRADING_HOST")
        ("port", po::value<int>(), "set the port to listen on, default to 5000. You can either pass it from environ GRADING_PORT")
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
        cout << "answer-server: hold the expected outputs and compare submission outputs on behalf of grader" << endl
             << "Only listens on loopback addresses" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "oi-grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("problems-dir")) {
        grader::PROBLEMS_DIR = filesystem::path(vm.at("problems-dir").as<string>());
    } else if (getenv("PROBLEMSDIR")) {
        grader::PROBLEMS_DIR = filesystem::path(getenv("PROBLEMSDIR"));
    }

    if (vm.count("grading-dir")) {
        grader::GRADING_DIR = filesystem::path(vm.at("grading-dir").as<string>());
    } else if (getenv("GRADINGDIR")) {
        grader::GRADING_DIR = filesystem::path(getenv("GRADINGDIR"));
    }
    CHECK(filesystem::is_directory(grader::GRADING_DIR))
        << "Grading directory " << grader::GRADING_DIR << " does not exist";

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

    filesystem::path catalog_file = vm.count("catalog")
                                        ? filesystem::path(vm["catalog"].as<string>())
                                        : grader::PROBLEMS_DIR / "catalog.json";

    // 题目目录与标准答案只在启动时加载一次，任何错误都会让服务拒绝启动
    const grader::catalog *problems;
    grader::answer_store store;
    try {
        problems = &grader::load_global_catalog(catalog_file);
        store = grader::answer_store::load(*problems, grader::GRADING_DIR);
    } catch (grader::catalog_error &e) {
        LOG(FATAL) << "Unable to load test data: " << e.what();
        return EXIT_FAILURE;
    }

    grader::answer_service service(*problems, move(store), grader::checker_registry::builtin());
    grader::answer_server server(service, grader::ANSWER_SERVICE_HOST, grader::ANSWER_SERVICE_PORT);

    signal(SIGINT, stopHandler);
    signal(SIGTERM, stopHandler);
    signal(SIGPIPE, SIG_IGN);

    LOG(INFO) << "Serving " << problems->problems().size() << " problems on port " << server.port();
    server.serve(stopped);

    return EXIT_SUCCESS;
}
