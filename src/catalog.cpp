#include "catalog.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <mutex>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

void from_json(const json &j, problem_spec &spec) {
    spec.id = get_value<string>(j, "id");
    spec.description = get_value_def<string>(j, "", "description");
    spec.difficulty = get_value_def<string>(j, "", "difficulty");
    spec.time_limit_seconds = get_value<double>(j, "time_limit_seconds");
    spec.memory_limit_mb = get_value_def<int>(j, 256, "memory_limit_mb");
    spec.checker = get_value_def<string>(j, "", "checker");
}

void to_json(json &j, const problem_spec &spec) {
    j = {{"id", spec.id},
         {"description", spec.description},
         {"difficulty", spec.difficulty},
         {"time_limit_seconds", spec.time_limit_seconds},
         {"memory_limit_mb", spec.memory_limit_mb},
         {"checker", spec.checker.empty() ? string(checker_registry::DEFAULT_CHECKER) : spec.checker}};
}

catalog catalog::parse(const json &j, const checker_registry &registry) {
    if (!j.is_object() || !exists(j, "problems") || !j.at("problems").is_array())
        throw catalog_error("catalog must be an object with a \"problems\" array");

    catalog result;
    for (auto &item : j.at("problems")) {
        problem_spec spec;
        try {
            spec = item.get<problem_spec>();
        } catch (std::invalid_argument &e) {
            throw catalog_error(fmt::format("malformed problem #{}: {}", result.specs.size() + 1, e.what()));
        }

        try {
            assert_safe_path(spec.id);
        } catch (std::runtime_error &) {
            throw catalog_error(fmt::format("problem id \"{}\" is not a valid directory name", spec.id));
        }
        if (result.index.count(spec.id))
            throw catalog_error(fmt::format("duplicate problem id {}", spec.id));
        if (!(spec.time_limit_seconds > 0))
            throw catalog_error(fmt::format("problem {} has non-positive time limit", spec.id));
        if (spec.memory_limit_mb <= 0)
            throw catalog_error(fmt::format("problem {} has non-positive memory limit", spec.id));
        if (!registry.contains(spec.checker))
            throw catalog_error(fmt::format("problem {} refers to unknown checker {}", spec.id, spec.checker));

        result.index[spec.id] = result.specs.size();
        result.specs.push_back(move(spec));
    }
    return result;
}

catalog catalog::load(const fs::path &file, const checker_registry &registry) {
    string content;
    try {
        content = read_file_content(file);
    } catch (std::system_error &e) {
        throw catalog_error(fmt::format("unable to read catalog {}: {}", file.string(), e.what()));
    }

    json j = json::parse(content, nullptr, false);
    if (j.is_discarded())
        throw catalog_error(fmt::format("catalog {} is not valid JSON", file.string()));

    catalog result = parse(j, registry);
    LOG(INFO) << "Loaded " << result.specs.size() << " problems from " << file;
    return result;
}

const problem_spec &catalog::find(const string &id) const {
    auto it = index.find(id);
    if (it == index.end())
        throw catalog_error(fmt::format("unknown problem {}", id));
    return specs[it->second];
}

bool catalog::contains(const string &id) const {
    return index.count(id) > 0;
}

const vector<problem_spec> &catalog::problems() const {
    return specs;
}

const catalog &load_global_catalog(const fs::path &file) {
    static once_flag flag;
    static catalog instance;
    call_once(flag, [&] {
        instance = catalog::load(file, checker_registry::builtin());
    });
    return instance;
}

vector<fs::path> list_ordinal_files(const fs::path &dir) {
    if (!fs::is_directory(dir))
        throw catalog_error(fmt::format("test data directory {} does not exist", dir.string()));

    map<int, fs::path> files;
    for (auto &entry : fs::directory_iterator(dir)) {
        fs::path p = entry.path();
        int ordinal = 0;
        if (p.extension() != ".txt" || !boost::conversion::try_lexical_convert(p.stem().string(), ordinal) || ordinal <= 0)
            throw catalog_error(fmt::format("unexpected file {} in test data directory {}", p.filename().string(), dir.string()));
        files[ordinal] = p;
    }

    vector<fs::path> result;
    int expected = 1;
    for (auto &[ordinal, p] : files) {
        if (ordinal != expected)
            throw catalog_error(fmt::format("test data in {} is not numbered 1..N: missing {}.txt", dir.string(), expected));
        result.push_back(p);
        ++expected;
    }
    if (result.empty())
        throw catalog_error(fmt::format("test data directory {} is empty", dir.string()));
    return result;
}

}  // namespace grader
