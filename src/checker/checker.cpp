#include "checker/checker.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <mutex>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

check_result check_result::accept(const string &message) {
    check_result result;
    result.passed = true;
    result.message = message;
    return result;
}

check_result check_result::reject(const string &message) {
    check_result result;
    result.passed = false;
    result.message = message;
    return result;
}

checker::~checker() {}

bool checker::ignores_exit_code() const {
    return false;
}

void checker_registry::add(checker_ptr &&c) {
    if (!c)
        throw checker_error("cannot register a null checker");
    string name = c->name();
    if (name.empty())
        throw checker_error("checker name must not be empty");
    if (c->tolerance_policy().empty())
        throw checker_error("checker " + name + " does not declare a tolerance policy");
    if (checkers.count(name))
        throw checker_error("checker " + name + " has already been registered");
    checkers.emplace(name, move(c));
}

const checker &checker_registry::resolve(const string &name) const {
    const string &key = name.empty() ? string(DEFAULT_CHECKER) : name;
    auto it = checkers.find(key);
    if (it == checkers.end())
        throw checker_error("unknown checker " + key);
    return *it->second;
}

bool checker_registry::contains(const string &name) const {
    return checkers.count(name.empty() ? string(DEFAULT_CHECKER) : name) > 0;
}

vector<string> checker_registry::names() const {
    vector<string> result;
    for (auto &[name, c] : checkers)
        result.push_back(name);
    return result;
}

const checker_registry &checker_registry::builtin() {
    static once_flag flag;
    static checker_registry registry;
    call_once(flag, [] {
        register_builtin_checkers(registry);
        LOG(INFO) << "Registered checkers: " << boost::algorithm::join(registry.names(), ", ");
    });
    return registry;
}

string normalize_output(const string &output) {
    vector<string> lines;
    boost::split(lines, output, boost::is_any_of("\n"));
    for (auto &line : lines)
        boost::trim_right(line);  // 同时会删除 CRLF 中的 \r
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();
    return boost::algorithm::join(lines, "\n");
}

vector<string> split_lines(const string &normalized) {
    vector<string> lines;
    if (normalized.empty()) return lines;
    boost::split(lines, normalized, boost::is_any_of("\n"));
    return lines;
}

vector<string> split_tokens(const string &text) {
    vector<string> tokens;
    string trimmed = boost::trim_copy(text);
    if (trimmed.empty()) return tokens;
    boost::split(tokens, trimmed, boost::is_any_of(" \t\r\n\v\f"), boost::token_compress_on);
    return tokens;
}

}  // namespace grader
