#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace runbox {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::SUCCESS, "Success")
    (status::RUNTIME_FAILURE, "Runtime Failure")
    (status::TIMEOUT, "Timeout")
    (status::TOOLING_UNAVAILABLE, "Tooling Unavailable")
    (status::INTERNAL_ERROR, "Internal Error");

static const unordered_map<status, const char *> status_name = boost::assign::map_list_of
    (status::SUCCESS, "success")
    (status::RUNTIME_FAILURE, "runtime_failure")
    (status::TIMEOUT, "timeout")
    (status::TOOLING_UNAVAILABLE, "tooling_unavailable")
    (status::INTERNAL_ERROR, "internal_error");
// clang-format on

const char *get_display_message(status s) {
    return status_string.at(s);
}

const char *get_status_name(status s) {
    return status_name.at(s);
}

}  // namespace runbox
