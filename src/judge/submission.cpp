#include "judge/submission.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;
namespace fs = std::filesystem;

const unordered_map<string, language> EXTENSIONS = boost::assign::map_list_of
    (".cpp", language::CPP)
    (".cc", language::CPP)
    (".cxx", language::CPP)
    (".py", language::PYTHON);

const char *get_serialized_name(language lang) {
    switch (lang) {
        case language::CPP: return "cpp";
        case language::PYTHON: return "python";
    }
    return "unknown";
}

compilation_error::compilation_error(const string &what, const string &error_log)
    : runtime_error(what), error_log(error_log) {}

submission make_submission(const string &problem_id, const fs::path &source) {
    string ext = boost::algorithm::to_lower_copy(source.extension().string());
    auto it = EXTENSIONS.find(ext);
    if (it == EXTENSIONS.end())
        throw compilation_error("Unsupported language",
                                fmt::format("Unsupported source file extension \"{}\", expected one of .cpp, .cc, .cxx, .py", ext));

    if (!fs::is_regular_file(source))
        throw compilation_error("Source file not found", fmt::format("Source file {} does not exist", source.filename().string()));

    submission submit;
    submit.problem_id = problem_id;
    submit.source = fs::absolute(source);
    submit.lang = it->second;
    return submit;
}

submission locate_submission(const string &problem_id, const fs::path &workdir) {
    for (const char *ext : {".cpp", ".py"}) {
        fs::path candidate = workdir / (problem_id + ext);
        if (fs::is_regular_file(candidate))
            return make_submission(problem_id, candidate);
    }
    throw compilation_error("Source file not found",
                            fmt::format("No solution found, expected {0}.cpp or {0}.py in the working directory", problem_id));
}

}  // namespace grader
