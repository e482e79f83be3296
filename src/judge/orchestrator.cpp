#include "judge/orchestrator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "judge/compiler.hpp"
#include "judge/sandbox.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

const char *get_display_message(grading_state state) {
    switch (state) {
        case grading_state::PENDING: return "Pending";
        case grading_state::COMPILING: return "Compiling";
        case grading_state::COMPILE_FAILED: return "Compile Failed";
        case grading_state::RUNNING: return "Running";
        case grading_state::EXECUTING: return "Executing";
        case grading_state::CHECKING: return "Checking";
        case grading_state::AGGREGATED: return "Aggregated";
    }
    return "Unknown";
}

orchestrator::orchestrator(const catalog &problems, answer_client &client,
                           const fs::path &problems_dir, const fs::path &run_dir)
    : problems(problems), client(client), problems_dir(problems_dir), run_dir(run_dir) {}

grading_state orchestrator::state() const {
    return current;
}

void orchestrator::set_listener(state_listener listener) {
    this->listener = move(listener);
}

void orchestrator::transit(grading_state next, int test_case) {
    current = next;
    if (test_case > 0)
        DLOG(INFO) << "Test case #" << test_case << ": " << get_display_message(next);
    else
        LOG(INFO) << "Grading state: " << get_display_message(next);
    if (listener) listener(next, test_case);
}

test_outcome orchestrator::grade_test_case(const problem_spec &spec, const compiled_artifact &artifact,
                                           const fs::path &input_file, int index) {
    test_outcome outcome;
    outcome.index = index;

    transit(grading_state::EXECUTING, index);
    execution_result result = run_test_case(artifact, input_file, spec.time_limit_seconds, spec.memory_limit_mb, run_dir / spec.id / "run");
    outcome.time_ms = result.wall_time_ms;
    outcome.stderr_data = result.stderr_data.substr(0, (size_t)max(STDERR_REPORT_LIMIT, 0));

    if (result.status == execution_status::TIMEOUT) {
        outcome.status = test_status::TIMEOUT;
        outcome.message = fmt::format("Time limit of {} seconds exceeded", spec.time_limit_seconds);
        return outcome;
    }

    transit(grading_state::CHECKING, index);
    protocol::check_request request;
    request.problem_id = spec.id;
    request.test_case = index;
    request.output = move(result.stdout_data);
    request.exited_cleanly = result.status == execution_status::OK;
    protocol::check_reply reply = client.check(request);

    outcome.score = reply.score;
    outcome.message = reply.message;
    if (reply.passed) {
        outcome.status = test_status::PASSED;
    } else if (result.status == execution_status::RUNTIME_ERROR) {
        outcome.status = test_status::RUNTIME_ERROR;
        outcome.message = result.signal > 0
                              ? fmt::format("Program terminated by signal {}", result.signal)
                              : fmt::format("Program exited with code {}", result.exit_code);
    } else {
        outcome.status = test_status::FAILED;
    }
    return outcome;
}

verdict orchestrator::grade(const grading_request &request) {
    current = grading_state::PENDING;

    // 题目不存在、输入数据不完整属于配置错误，在开始评测之前抛出
    const problem_spec &spec = problems.find(request.problem_id);
    vector<fs::path> inputs = list_ordinal_files(problems_dir / spec.id / "input");

    optional<language> lang;
    scoped_file_lock lock;
    try {
        lock = lock_directory(run_dir / spec.id, false);
    } catch (std::system_error &e) {
        transit(grading_state::AGGREGATED);
        return verdict::infra_error(fmt::format("working directory is busy: {}", e.what()));
    }

    defer {
        if (!DEBUG) {
            error_code ec;
            fs::remove_all(run_dir / spec.id / "run", ec);
            fs::remove_all(run_dir / spec.id / "bin", ec);
        }
    };

    transit(grading_state::COMPILING);
    compiled_artifact artifact;
    try {
        submission submit = request.source.empty()
                                ? locate_submission(spec.id, request.workdir)
                                : make_submission(spec.id, request.source);
        lang = submit.lang;
        artifact = compile(submit, run_dir / spec.id / "compile", run_dir / spec.id / "bin");
    } catch (compilation_error &e) {
        LOG(INFO) << "Compilation failed: " << e.what();
        transit(grading_state::COMPILE_FAILED);
        return verdict::compile_error(e.error_log, lang);
    } catch (internal_error &e) {
        LOG(ERROR) << "Internal error while compiling: " << e.what();
        transit(grading_state::AGGREGATED);
        return verdict::infra_error(e.what(), lang);
    } catch (std::system_error &e) {
        LOG(ERROR) << "System error while compiling: " << e.what();
        transit(grading_state::AGGREGATED);
        return verdict::infra_error(e.what(), lang);
    }

    transit(grading_state::RUNNING);
    vector<test_outcome> outcomes;
    try {
        vector<int> tests = client.list_tests(spec.id);
        if (tests.size() != inputs.size())
            throw infra_error(fmt::format("answer service has {} test cases for problem {}, but {} inputs were found",
                                          tests.size(), spec.id, inputs.size()));

        for (size_t i = 0; i < inputs.size(); ++i) {
            test_outcome outcome = grade_test_case(spec, artifact, inputs[i], (int)i + 1);
            LOG(INFO) << fmt::format("Test case #{}: {}", outcome.index, get_display_message(outcome.status));
            outcomes.push_back(move(outcome));
        }
    } catch (infra_error &e) {
        LOG(ERROR) << "Infrastructure error: " << e.what();
        transit(grading_state::AGGREGATED);
        return verdict::infra_error(e.what(), lang);
    } catch (internal_error &e) {
        LOG(ERROR) << "Internal error while running: " << e.what();
        transit(grading_state::AGGREGATED);
        return verdict::infra_error(e.what(), lang);
    } catch (std::system_error &e) {
        LOG(ERROR) << "System error while running: " << e.what();
        transit(grading_state::AGGREGATED);
        return verdict::infra_error(e.what(), lang);
    }

    verdict result = verdict::aggregate(move(outcomes), lang);
    transit(grading_state::AGGREGATED);
    LOG(INFO) << fmt::format("Problem {}: {} ({}/{})", spec.id, get_display_message(result.status), result.passed(), result.total());
    return result;
}

}  // namespace grader
