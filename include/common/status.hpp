#pragma once

namespace runbox {

/**
 * @brief 表示一次执行的分类结果
 * 与 execution_result 的各个分支一一对应，用于日志、统计和 JSON 输出
 */
enum class status {
    /**
     * @brief 用户程序正常退出，返回码为 0
     */
    SUCCESS = 0,

    /**
     * @brief 用户程序返回码非 0
     * 对于编译型语言，编译错误也属于这种情况。
     */
    RUNTIME_FAILURE = 1,

    /**
     * @brief 用户程序运行时间超出限制，已被强制终止
     */
    TIMEOUT = 2,

    /**
     * @brief 容器运行时不可用（比如 docker 没有安装，或 docker 服务没有启动）
     * 这是运维配置问题，与用户代码无关。
     */
    TOOLING_UNAVAILABLE = 3,

    /**
     * @brief 执行引擎内部错误，比如无法写入工作目录
     */
    INTERNAL_ERROR = 4
};

/**
 * @brief 获得结果的可读名称，比如 "Runtime Failure"
 */
const char *get_display_message(status);

/**
 * @brief 获得结果在 JSON 中使用的名称，比如 "runtime_failure"
 */
const char *get_status_name(status);

}  // namespace runbox
