#include "service/answer_client.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <system_error>
#include <thread>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/socket.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

answer_client::~answer_client() {}

tcp_answer_client::tcp_answer_client(const string &host, int port, chrono::milliseconds timeout)
    : host(host), port(port), timeout(timeout) {}

json tcp_answer_client::call_once(const string &line) {
    deadline_t deadline = deadline_after(timeout);
    socket_fd sock = connect_loopback(host, port, deadline);
    send_all(sock, line, deadline);
    string response = receive_line(sock, deadline, protocol::MAX_MESSAGE_SIZE);

    json j = json::parse(response, nullptr, false);
    if (j.is_discarded())
        throw system_error(make_error_code(errc::bad_message), "malformed response");
    return j;
}

json tcp_answer_client::call(const json &request) {
    string line = protocol::to_line(request);
    json response;
    try {
        response = call_once(line);
    } catch (std::system_error &e) {
        LOG(WARNING) << "Answer service request failed, retrying once: " << e.what();
        try {
            response = call_once(line);
        } catch (std::system_error &retry_error) {
            throw infra_error(fmt::format("answer service unreachable at {}:{}: {}", host, port, retry_error.what()));
        }
    } catch (std::invalid_argument &e) {
        throw infra_error(e.what());
    }

    try {
        protocol::expect_ok(response);
    } catch (protocol::protocol_error &e) {
        throw infra_error(fmt::format("answer service rejected the request: {}", e.what()));
    }
    return response;
}

bool tcp_answer_client::health() {
    try {
        json response = call_once(protocol::to_line({{"method", "health"}}));
        return get_value_def<string>(response, "", "status") == "ok" && get_value_def<bool>(response, false, "ready");
    } catch (std::system_error &) {
        return false;
    } catch (std::invalid_argument &) {
        return false;
    }
}

vector<int> tcp_answer_client::list_tests(const string &problem_id) {
    json response = call({{"method", "list_tests"}, {"problem_id", problem_id}});
    try {
        return response.get<protocol::list_tests_reply>().tests;
    } catch (std::invalid_argument &e) {
        throw infra_error(fmt::format("malformed list_tests response: {}", e.what()));
    }
}

protocol::check_reply tcp_answer_client::check(const protocol::check_request &request) {
    json response = call(request);
    try {
        return response.get<protocol::check_reply>();
    } catch (std::invalid_argument &e) {
        throw infra_error(fmt::format("malformed check response: {}", e.what()));
    }
}

void wait_until_ready(answer_client &client, chrono::milliseconds timeout, chrono::milliseconds interval) {
    auto deadline = chrono::steady_clock::now() + timeout;
    while (true) {
        if (client.health()) return;
        if (chrono::steady_clock::now() + interval > deadline)
            throw infra_error(fmt::format("answer service not ready after {} ms", timeout.count()));
        this_thread::sleep_for(interval);
    }
}

}  // namespace grader
