#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include "common/status.hpp"
#include "sandbox/container.hpp"

namespace runbox {

/**
 * 一次执行的分类结果。execution_result 是封闭的 variant，
 * 调用者通过 std::visit 必须处理每一种结果。
 */
namespace result {

struct common {
    /**
     * @brief 返回给调用者的文本
     */
    std::string output;

    /**
     * @brief 执行花费的时钟时间，精确到毫秒
     */
    std::chrono::milliseconds elapsed{0};

    /**
     * @brief 源代码指纹，仅用于日志关联
     */
    std::string fingerprint;
};

/**
 * @brief 程序返回 0，output 为去除首尾空白的 stdout
 */
struct success : common {};

/**
 * @brief 程序返回非 0（包括编译错误），output 包含返回码和 stderr
 */
struct runtime_failure : common {
    int exit_code = 0;
};

/**
 * @brief 程序运行超时，已被强制终止
 */
struct timeout : common {};

/**
 * @brief 容器运行时不可用，属于运维问题
 */
struct tooling_unavailable : common {};

/**
 * @brief 执行引擎内部错误，比如无法写入工作目录
 */
struct internal_error : common {};

}  // namespace result

using execution_result = std::variant<result::success,
                                      result::runtime_failure,
                                      result::timeout,
                                      result::tooling_unavailable,
                                      result::internal_error>;

/**
 * @brief 将容器运行时的原始结果分类
 * 该函数对任意输入都有定义，判断顺序为：
 * 1. spawn_error 非空：tooling_unavailable
 * 2. terminated_by_timeout：timeout
 * 3. 返回码为 0：success，stdout 为空时 output 为 "Execution completed (no output)"
 * 4. 返回码非 0：runtime_failure，output 为 "Error (Code {返回码}):\n{stderr}"
 * 5. 没有返回码：internal_error
 * @param outcome 原始结果
 * @param timeout 本次执行的时间限制，用于生成超时信息
 * @param fingerprint 源代码指纹
 */
execution_result classify(const raw_process_outcome &outcome, std::chrono::seconds timeout, const std::string &fingerprint);

/**
 * @brief 将不合法的 UTF-8 字节序列替换为 U+FFFD
 * 程序输出可能是任意字节，也可能在截断时被切断在多字节字符中间，
 * 结果中的 output 总是经过该函数处理，保证可以序列化为 JSON
 */
std::string to_valid_utf8(const std::string &text);

/**
 * @brief 构造 internal_error 结果
 * @param message 返回给调用者的错误信息
 */
execution_result make_internal_error(const std::string &message, std::chrono::milliseconds elapsed, const std::string &fingerprint);

status get_status(const execution_result &res);

const result::common &get_common(const execution_result &res);

bool is_success(const execution_result &res);

/**
 * @brief 生成返回给调用者的 JSON
 * @code{.json}
 * {
 *     "output": "hi",
 *     "success": true,
 *     "executionTimeSeconds": 0.532,
 *     "fingerprint": "701bf4a4",
 *     "status": "success"
 * }
 * @endcode
 */
nlohmann::json make_response(const execution_result &res);

}  // namespace runbox
