#include "sandbox/result.hpp"
#include <fmt/core.h>
#include "common/utils.hpp"

namespace runbox {
using namespace std;
using namespace nlohmann;

string to_valid_utf8(const string &text) {
    // 序列化时把不合法的 UTF-8 字节替换为 U+FFFD，再解析回字符串
    return json::parse(json(text).dump(-1, ' ', false, json::error_handler_t::replace)).get<string>();
}

template <typename T>
static execution_result make_result(string output, chrono::milliseconds elapsed, const string &fingerprint) {
    T res;
    res.output = to_valid_utf8(output);
    res.elapsed = elapsed;
    res.fingerprint = fingerprint;
    return res;
}

execution_result classify(const raw_process_outcome &outcome, chrono::seconds timeout, const string &fingerprint) {
    if (outcome.spawn_error) {
        return make_result<result::tooling_unavailable>(
            fmt::format("Container runtime is unavailable, unable to execute code.\n{}", *outcome.spawn_error),
            outcome.elapsed, fingerprint);
    }

    if (outcome.terminated_by_timeout) {
        return make_result<result::timeout>(
            fmt::format("Execution timed out after {} seconds", timeout.count()),
            outcome.elapsed, fingerprint);
    }

    if (!outcome.exit_code) {
        return make_internal_error("Execution error: container runtime exited without an exit status", outcome.elapsed, fingerprint);
    }

    if (*outcome.exit_code == 0) {
        string output = trim(outcome.stdout_data);
        if (output.empty()) output = "Execution completed (no output)";
        return make_result<result::success>(move(output), outcome.elapsed, fingerprint);
    }

    result::runtime_failure failure;
    failure.output = to_valid_utf8(trim(fmt::format("Error (Code {}):\n{}", *outcome.exit_code, outcome.stderr_data)));
    failure.elapsed = outcome.elapsed;
    failure.fingerprint = fingerprint;
    failure.exit_code = *outcome.exit_code;
    return failure;
}

execution_result make_internal_error(const string &message, chrono::milliseconds elapsed, const string &fingerprint) {
    return make_result<result::internal_error>(message, elapsed, fingerprint);
}

struct status_visitor {
    status operator()(const result::success &) const { return status::SUCCESS; }
    status operator()(const result::runtime_failure &) const { return status::RUNTIME_FAILURE; }
    status operator()(const result::timeout &) const { return status::TIMEOUT; }
    status operator()(const result::tooling_unavailable &) const { return status::TOOLING_UNAVAILABLE; }
    status operator()(const result::internal_error &) const { return status::INTERNAL_ERROR; }
};

status get_status(const execution_result &res) {
    return visit(status_visitor(), res);
}

const result::common &get_common(const execution_result &res) {
    return visit([](const auto &r) -> const result::common & { return r; }, res);
}

bool is_success(const execution_result &res) {
    return holds_alternative<result::success>(res);
}

json make_response(const execution_result &res) {
    const result::common &common = get_common(res);
    return {{"output", common.output},
            {"success", is_success(res)},
            {"executionTimeSeconds", common.elapsed.count() / 1000.0},
            {"fingerprint", common.fingerprint},
            {"status", get_status_name(get_status(res))}};
}

}  // namespace runbox
