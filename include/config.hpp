#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "sandbox/container.hpp"
#include "sandbox/language.hpp"

namespace runbox {

/**
 * @brief 超出并发上限时的准入策略
 */
enum class admission_policy {
    /**
     * @brief 排队等待空闲名额
     */
    QUEUE,

    /**
     * @brief 立即拒绝，抛出 capacity_exceeded
     */
    REJECT
};

/**
 * @brief 执行引擎的配置
 * 在构造 executor 时传入，之后不再修改。配置文件为 JSON 格式，所有的键都是可选的：
 * @code{.json}
 * {
 *     "runtime": "docker",
 *     "workspaceRoot": "/tmp/runbox",
 *     "maxSourceBytes": 10000,
 *     "defaultTimeoutSeconds": 15,
 *     "memoryLimitMB": 128,
 *     "cpus": 0.5,
 *     "maxOutputBytes": 1048576,
 *     "killDelayMilliseconds": 100,
 *     "maxConcurrentExecutions": 0,
 *     "admission": "queue",
 *     "builtinLanguages": true,
 *     "languages": [
 *         {"id": "ruby", "filename": "code.rb", "image": "ruby:3-slim", "command": ["ruby", "{source}"]}
 *     ]
 * }
 * @endcode
 */
struct executor_config {
    /**
     * @brief 容器运行时的可执行文件
     */
    std::filesystem::path runtime = "docker";

    /**
     * @brief 存放临时工作目录的根目录
     * 若将这个文件夹放进内存盘，可以加快写入源代码的速度。
     * @defaultValue 系统临时目录下的 runbox 文件夹
     */
    std::filesystem::path workspace_root = std::filesystem::temp_directory_path() / "runbox";

    /**
     * @brief 源代码的最大字节数
     */
    std::size_t max_source_bytes = 10000;

    /**
     * @brief 请求没有指定时间限制时使用的时间限制
     */
    std::chrono::seconds default_timeout{15};

    /**
     * @brief 请求可以指定的最大时间限制，超出时请求被拒绝
     */
    std::chrono::seconds max_timeout{300};

    /**
     * @brief 容器资源上限，所有请求共用
     */
    container_limits limits;

    /**
     * @brief 最多同时执行的数量，0 表示不限制
     */
    std::size_t max_concurrent_executions = 0;

    admission_policy admission = admission_policy::QUEUE;

    language_registry languages;
};

void from_json(const nlohmann::json &j, executor_config &config);

/**
 * @brief 从 JSON 文件读取配置
 * @throw std::invalid_argument 文件不存在或格式不正确
 */
executor_config load_config(const std::filesystem::path &path);

admission_policy parse_admission_policy(const std::string &name);

}  // namespace runbox
