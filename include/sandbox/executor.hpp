#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>
#include "common/semaphore.hpp"
#include "config.hpp"
#include "monitor/monitor.hpp"
#include "sandbox/container.hpp"
#include "sandbox/request.hpp"
#include "sandbox/result.hpp"

namespace runbox {

/**
 * @brief 执行引擎入口
 *
 * 一次执行的流程：
 * 1. 校验请求（语言、代码长度、时间限制），不合法时抛出 request_error 的子类；
 * 2. 按准入策略获取执行名额；
 * 3. 创建工作目录并写入源代码；
 * 4. 启动容器执行代码；
 * 5. 将原始运行结果归类为 execution_result；
 * 6. 删除工作目录，通知所有监控器。
 *
 * 第 3 步之后的任何错误都不会以异常的形式抛出，而是以 result::internal_error 返回。
 * executor 可以被多个线程同时调用，同时执行的任务数受 max_concurrent_executions 限制。
 */
struct executor {
    explicit executor(executor_config config, std::vector<std::shared_ptr<monitor>> monitors = {});

    /**
     * @brief 校验请求
     * @return 请求对应的语言配置
     * @throw unsupported_language 语言未注册
     * @throw payload_too_large 代码超过 max_source_bytes
     * @throw invalid_request 代码为空，或者时间限制不是正数、超过 max_timeout
     */
    const language_profile &validate(const execution_request &request) const;

    /**
     * @brief 执行代码，阻塞到执行结束为止
     * @throw request_error 请求不合法，或者准入策略为拒绝且执行名额已满
     */
    execution_result execute(const execution_request &request) const;

    /**
     * @brief 在新线程中执行代码
     * 请求的校验错误在 future.get() 时抛出
     */
    std::future<execution_result> execute_async(execution_request request) const;

    /**
     * @brief 容器运行时是否可用
     */
    bool runtime_available() const;

    const executor_config &config() const;

    const language_registry &languages() const;

private:
    semaphore_permit admit() const;

    void report(const execution_request &request, const language_profile &profile, const execution_result &res) const;

    executor_config conf;
    container_invoker invoker;
    std::vector<std::shared_ptr<monitor>> monitors;
    mutable semaphore gate;
};

}  // namespace runbox
