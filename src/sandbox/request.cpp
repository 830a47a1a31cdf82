#include "sandbox/request.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"

namespace runbox {
using namespace std;
using namespace nlohmann;

// 只用于拒绝无法表示的数值，实际的上限由 executor_config::max_timeout 决定
const double MAX_TIMEOUT_SECONDS = 1e9;

void from_json(const json &j, execution_request &request) {
    j.at("code").get_to(request.code);
    if (j.count("language"))
        j.at("language").get_to(request.language);
    if (j.count("timeoutSeconds") && !j.at("timeoutSeconds").is_null()) {
        // 先按浮点数读取，避免超出 long 范围的数值在转换时溢出
        double timeout = j.at("timeoutSeconds").get<double>();
        if (!(timeout > -MAX_TIMEOUT_SECONDS && timeout < MAX_TIMEOUT_SECONDS))
            throw invalid_request(fmt::format("timeoutSeconds {} is out of range", j.at("timeoutSeconds").dump()));
        request.timeout = chrono::seconds((long)timeout);
    }
    if (j.count("actor"))
        j.at("actor").get_to(request.actor);
}

}  // namespace runbox
