#include "common/exceptions.hpp"
#include <fmt/core.h>
#include <boost/exception/diagnostic_information.hpp>

namespace runbox {
using namespace std;

runbox_exception::runbox_exception()
    : runbox_exception("") {}

runbox_exception::runbox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *runbox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const runbox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : runbox_exception() {}

internal_error::internal_error(const string &message)
    : runbox_exception(message) {}

workspace_error::workspace_error(const string &message)
    : runbox_exception(message) {}

request_error::request_error(const string &message)
    : runbox_exception(message) {}

unsupported_language::unsupported_language(const string &language)
    : request_error("Unsupported language: " + language), language(language) {}

payload_too_large::payload_too_large(size_t size, size_t limit)
    : request_error(fmt::format("Code too large ({} bytes, max {} bytes)", size, limit)), size(size), limit(limit) {}

invalid_request::invalid_request(const string &message)
    : request_error(message) {}

capacity_exceeded::capacity_exceeded(size_t limit)
    : request_error(fmt::format("Too many concurrent executions (limit {})", limit)) {}

}  // namespace runbox
