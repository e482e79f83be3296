#include "service/answer_store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

answer_store answer_store::load(const catalog &problems, const fs::path &grading_dir) {
    answer_store store;
    for (auto &spec : problems.problems()) {
        vector<fs::path> inputs = list_ordinal_files(grading_dir / "inputs" / spec.id);
        vector<fs::path> outputs = list_ordinal_files(grading_dir / "outputs" / spec.id);
        if (inputs.size() != outputs.size())
            throw catalog_error(fmt::format("problem {} has {} inputs but {} outputs", spec.id, inputs.size(), outputs.size()));

        vector<test_case_data> test_cases;
        for (size_t i = 0; i < inputs.size(); ++i) {
            test_case_data data;
            data.input = read_file_content(inputs[i]);
            data.expected = read_file_content(outputs[i]);
            test_cases.push_back(move(data));
        }
        LOG(INFO) << "Loaded " << test_cases.size() << " test cases for problem " << spec.id;
        store.add(spec.id, move(test_cases));
    }
    return store;
}

bool answer_store::contains(const string &problem_id) const {
    return problems.count(problem_id) > 0;
}

size_t answer_store::count(const string &problem_id) const {
    return problems.at(problem_id).size();
}

const test_case_data &answer_store::get(const string &problem_id, int index) const {
    auto &test_cases = problems.at(problem_id);
    if (index < 1 || (size_t)index > test_cases.size())
        throw out_of_range("test case index out of range");
    return test_cases[index - 1];
}

void answer_store::add(const string &problem_id, vector<test_case_data> &&test_cases) {
    problems[problem_id] = move(test_cases);
}

}  // namespace grader
