#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace grader {
using namespace std;

grader_exception::grader_exception()
    : grader_exception("") {}

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : grader_exception() {}

internal_error::internal_error(const string &message)
    : grader_exception(message) {}

infra_error::infra_error()
    : grader_exception() {}

infra_error::infra_error(const string &message)
    : grader_exception(message) {}

catalog_error::catalog_error()
    : grader_exception() {}

catalog_error::catalog_error(const string &message)
    : grader_exception(message) {}

checker_error::checker_error()
    : grader_exception() {}

checker_error::checker_error(const string &message)
    : grader_exception(message) {}

}  // namespace grader
