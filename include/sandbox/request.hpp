#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace runbox {

/**
 * @brief 一次代码执行请求
 * 调用者需要在提交请求之前完成身份验证与鉴权，执行引擎不会校验 actor。
 */
struct execution_request {
    /**
     * @brief 用户提交的源代码，按字节原样写入源文件
     */
    std::string code;

    /**
     * @brief 语言标识，必须在语言表中注册
     */
    std::string language = "python";

    /**
     * @brief 时钟时间限制，为空时使用配置中的默认值
     */
    std::optional<std::chrono::seconds> timeout;

    /**
     * @brief 调用者的身份，仅用于监控记录
     */
    std::string actor;
};

/**
 * @code{.json}
 * {"code": "print('hi')", "language": "python", "timeoutSeconds": 15, "actor": "alice"}
 * @endcode
 * 只有 code 是必需的。
 */
void from_json(const nlohmann::json &j, execution_request &request);

}  // namespace runbox
