#include <glog/logging.h>
#include <grp.h>
#include <math.h>
#include <pwd.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include "run.hpp"

using namespace std;

void validate(boost::any& v, const vector<string>& values, size_t*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const& s = validators::get_single_string(values);
    if (s.empty() || s[0] == '-') {
        throw validation_error(validation_error::invalid_option_value);
    }

    try {
        v = boost::lexical_cast<size_t>(s);
    } catch (boost::bad_lexical_cast&) {
        throw validation_error(validation_error::invalid_option_value);
    }
}

void validate(boost::any& v, const vector<string>& values, struct time_limit*, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    struct time_limit result;
    string const& s = validators::get_single_string(values);
    auto colon = s.find(':');
    string left = s.substr(0, colon);
    string right = colon < s.size() ? s.substr(colon + 1) : "";

    try {
        result.soft = boost::lexical_cast<double>(left);
        if (right.size())
            result.hard = boost::lexical_cast<double>(right);
        else
            result.hard = result.soft;
    } catch (boost::bad_lexical_cast&) {
        throw validation_error(validation_error::invalid_option_value);
    }

    if (result.hard < result.soft ||
        !isfinite(result.hard) || !isfinite(result.soft) ||
        result.hard <= 0 || result.soft <= 0)
        throw validation_error(validation_error::invalid_option_value);

    v = result;
}

static bool is_number(const string& s) {
    return !s.empty() && all_of(s.begin(), s.end(), [](unsigned char c) { return isdigit(c); });
}

/**
 * @brief 将用户名（用户组名）或者数字 id 解析为 id
 * @throw runtime_error 用户或者用户组不存在
 */
static int resolve_id(const string& name, bool is_user) {
    if (is_number(name))
        return boost::lexical_cast<int>(name);

    if (is_user) {
        if (struct passwd* pwd = getpwnam(name.c_str()))
            return (int)pwd->pw_uid;
    } else {
        if (struct group* g = getgrnam(name.c_str()))
            return (int)g->gr_gid;
    }
    throw runtime_error((is_user ? "unknown user " : "unknown group ") + name);
}

static int64_t kilobytes_to_bytes(size_t kb) {
    if (kb > (size_t)INT64_MAX / 1024) return -1;
    return (int64_t)kb * 1024;
}

int main(int argc, const char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("runguard options");
    po::positional_options_description pos;
    po::variables_map vm;

    struct runguard_options opt;

    // clang-format off
    desc.add_options()
        ("work-dir,d", po::value<string>(), "change to this directory before running command")
        ("user,u", po::value<string>(), "run command as user with username or user id")
        ("group,g", po::value<string>(), "run command under group with groupname or group id. If only 'user' is set, this defaults to the same")
        ("wall-time,T", po::value<time_limit>(), "kill command after wall time clock seconds (floating point is acceptable)")
        ("cpu-time,t", po::value<time_limit>(), "set maximum CPU time (floating point is acceptable) consumption of the command in seconds")
        ("memory-limit,m", po::value<size_t>(), "set maximum address space of the command in KB")
        ("file-limit,f", po::value<size_t>(), "set maximum created file size of the command in KB")
        ("nproc,p", po::value<size_t>(), "set maximum process living simutanously")
        ("no-core-dumps", "disable core dumps")
        ("no-isolate", "do not move the command into new network/ipc/uts namespaces")
        ("allow-root", "allow running the command as root, for debugging only")
        ("standard-input-file,i", po::value<string>(), "redirect command standard input fd to file")
        ("standard-output-file,o", po::value<string>(), "redirect command standard output fd to file")
        ("standard-error-file,e", po::value<string>(), "redirect command standard error fd to file")
        ("stream-size,s", po::value<size_t>(), "truncate command output streams at the size in KB")
        ("environment,E", "preseve system environment variables (or only PATH is loaded)")
        ("out-meta,M", po::value<string>(), "write runguard monitor results (run time, exitcode, memory usage, ...) to file")
        ("cmd", po::value<vector<string>>()->composing()->required(), "commands")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "Runguard: Running user program in protected mode with system resource access limitations." << endl
                 << "This app requires root privilege if 'user' option is provided." << endl
                 << "Usage: " << argv[0] << " [options] -- [command]" << endl;
            cout << desc << endl;
            return 0;
        }

        if (vm.count("version")) {
            cout << "runguard" << endl;
            return 0;
        }
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return 1;
    }

    try {
        if (vm.count("work-dir")) opt.work_dir = vm["work-dir"].as<string>();

        if (vm.count("user")) {
            opt.user_id = resolve_id(vm["user"].as<string>(), true);
        }

        if (vm.count("group")) {
            opt.group_id = resolve_id(vm["group"].as<string>(), false);
        } else if (vm.count("user")) {
            opt.group_id = resolve_id(vm["user"].as<string>(), false);
        }
    } catch (exception& e) {
        cerr << e.what() << endl;
        return 1;
    }

    if (vm.count("wall-time")) opt.use_wall_limit = true, opt.wall_limit = vm["wall-time"].as<time_limit>();
    if (vm.count("cpu-time")) opt.use_cpu_limit = true, opt.cpu_limit = vm["cpu-time"].as<time_limit>();
    if (vm.count("memory-limit")) opt.memory_limit = kilobytes_to_bytes(vm["memory-limit"].as<size_t>());
    if (vm.count("file-limit")) opt.file_limit = kilobytes_to_bytes(vm["file-limit"].as<size_t>());
    if (vm.count("stream-size")) opt.stream_size = kilobytes_to_bytes(vm["stream-size"].as<size_t>());
    if (vm.count("nproc")) opt.nproc = vm["nproc"].as<size_t>();
    if (vm.count("no-core-dumps")) opt.no_core_dumps = true;
    if (vm.count("no-isolate")) opt.isolate = false;
    if (vm.count("allow-root")) opt.allow_root = true;
    if (vm.count("standard-input-file")) opt.stdin_filename = vm["standard-input-file"].as<string>();
    if (vm.count("standard-output-file")) opt.stdout_filename = vm["standard-output-file"].as<string>();
    if (vm.count("standard-error-file")) opt.stderr_filename = vm["standard-error-file"].as<string>();
    if (vm.count("environment")) opt.preserve_sys_env = true;
    if (vm.count("out-meta")) opt.metafile_path = vm["out-meta"].as<string>();
    opt.command = vm["cmd"].as<vector<string>>();

    return runit(opt);
}
