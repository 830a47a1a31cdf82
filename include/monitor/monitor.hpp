#pragma once

#include <string>
#include "common/status.hpp"

namespace runbox {

/**
 * @brief 一次执行结束后上报给监控器的信息
 */
struct execution_record {
    /**
     * @brief 调用者身份，执行引擎不校验其内容
     */
    std::string actor;

    std::string language;

    /**
     * @brief 源代码指纹，用于关联日志
     */
    std::string fingerprint;

    double execution_time_seconds = 0;

    bool success = false;

    status result = status::INTERNAL_ERROR;
};

/**
 * @brief 执行监控行为
 * 监控器可能被多个执行线程同时调用，实现需要自行保证线程安全。
 * 监控器抛出的异常只会被记录到日志，不会影响执行结果。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报一次执行已经结束
     * @param record 执行信息
     */
    virtual void end_execution(const execution_record &record) = 0;
};

/**
 * @brief 将每次执行的信息写入日志
 */
struct log_monitor : public monitor {
    void end_execution(const execution_record &record) override;
};

}  // namespace runbox
