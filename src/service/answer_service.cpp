#include "service/answer_service.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static constexpr size_t MIN_SCRUB_LENGTH = 4;

answer_service::answer_service(const catalog &problems, answer_store &&store, const checker_registry &registry)
    : problems(problems), store(move(store)), registry(registry) {}

string scrub_message(const string &message, const string &expected) {
    auto leaks = [&](const string &fragment) {
        return fragment.size() >= MIN_SCRUB_LENGTH && message.find(fragment) != string::npos;
    };

    for (auto &line : split_lines(normalize_output(expected)))
        if (leaks(boost::algorithm::trim_copy(line)))
            return "Wrong answer";
    for (auto &token : split_tokens(expected))
        if (leaks(token))
            return "Wrong answer";
    return message;
}

protocol::list_tests_reply answer_service::list_tests(const string &problem_id) const {
    if (!store.contains(problem_id))
        throw protocol::protocol_error("unknown problem");

    protocol::list_tests_reply reply;
    reply.problem_id = problem_id;
    for (size_t i = 1; i <= store.count(problem_id); ++i)
        reply.tests.push_back((int)i);
    return reply;
}

protocol::check_reply answer_service::check(const protocol::check_request &request) const {
    if (!problems.contains(request.problem_id) || !store.contains(request.problem_id))
        throw protocol::protocol_error("unknown problem");
    if (request.test_case < 1 || (size_t)request.test_case > store.count(request.problem_id))
        throw protocol::protocol_error("unknown test case");

    const problem_spec &spec = problems.find(request.problem_id);
    const checker &c = registry.resolve(spec.checker);
    const test_case_data &data = store.get(request.problem_id, request.test_case);

    check_result result;
    try {
        result = c.check(data.input, data.expected, request.output);
    } catch (std::exception &e) {
        // 选手输出无法解析，视为错误答案，不把异常信息返回给选手
        DLOG(INFO) << "Checker " << c.name() << " threw on problem " << request.problem_id << " test " << request.test_case;
        result = check_result::reject("checker rejected output");
    }

    protocol::check_reply reply;
    reply.passed = result.passed;
    reply.score = result.score ? min(1.0, max(0.0, *result.score)) : (result.passed ? 1.0 : 0.0);
    reply.message = scrub_message(result.message, data.expected);

    if (!request.exited_cleanly && !c.ignores_exit_code() && reply.passed) {
        reply.passed = false;
        reply.score = 0;
        reply.message = "Output accepted but the program exited abnormally";
    }

    LOG(INFO) << fmt::format("check {} #{}: {}", request.problem_id, request.test_case, reply.passed ? "AC" : "WA");
    return reply;
}

json answer_service::handle(const json &request) const {
    try {
        if (!request.is_object())
            throw protocol::protocol_error("request must be a JSON object");

        string method = get_value<string>(request, "method");
        if (method == "health") {
            return {{"status", "ok"}, {"ready", true}, {"service", "answer-service"}};
        } else if (method == "list_tests") {
            return list_tests(get_value<string>(request, "problem_id"));
        } else if (method == "check") {
            return check(request.get<protocol::check_request>());
        } else {
            throw protocol::protocol_error("unknown method");
        }
    } catch (protocol::protocol_error &e) {
        return protocol::make_error(e.what());
    } catch (std::invalid_argument &e) {
        return protocol::make_error(e.what());
    } catch (checker_error &e) {
        LOG(ERROR) << "Checker error: " << e.what();
        return protocol::make_error("checker unavailable");
    }
}

string answer_service::handle_line(const string &line) const {
    json request = json::parse(line, nullptr, false);
    if (request.is_discarded())
        return protocol::to_line(protocol::make_error("malformed JSON request"));
    return protocol::to_line(handle(request));
}

answer_server::answer_server(const answer_service &service, const string &host, int port)
    : service(service), listener(listen_loopback(host, port)) {
    LOG(INFO) << "Answer service listening on " << host << ":" << this->port();
}

int answer_server::port() const {
    return local_port(listener);
}

bool answer_server::serve_one(chrono::milliseconds wait) {
    string peer;
    socket_fd client = accept_connection(listener, wait, &peer);
    if (!client.valid()) return false;

    if (!is_loopback_address(peer)) {
        LOG(WARNING) << "Refusing connection from non-loopback peer " << peer;
        return true;
    }

    try {
        deadline_t deadline = deadline_after(chrono::milliseconds(ANSWER_SERVICE_TIMEOUT_MS));
        string line = receive_line(client, deadline, protocol::MAX_MESSAGE_SIZE);
        send_all(client, service.handle_line(line), deadline_after(chrono::milliseconds(ANSWER_SERVICE_TIMEOUT_MS)));
    } catch (std::system_error &e) {
        LOG(WARNING) << "Dropping connection: " << e.what();
    }
    return true;
}

void answer_server::serve(const atomic<bool> &stopped) {
    while (!stopped) {
        try {
            serve_one(chrono::milliseconds(200));
        } catch (std::system_error &e) {
            LOG(ERROR) << "Accept failed: " << e.what();
        }
    }
    LOG(INFO) << "Answer service stopped";
}

}  // namespace grader
