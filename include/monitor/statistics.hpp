#pragma once

#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include "monitor/monitor.hpp"

namespace runbox {

/**
 * @brief 在内存中统计执行次数、成功率、各语言的使用次数
 * 统计结果不会持久化，进程退出后即丢失。
 */
struct statistics_monitor : public monitor {
    void end_execution(const execution_record &record) override;

    std::size_t total_executions() const;

    std::size_t successful_executions() const;

    /**
     * @brief 成功率，百分比，保留两位小数；没有执行过时为 0
     */
    double success_rate() const;

    /**
     * @brief 各种结果的次数
     */
    std::size_t count(status result) const;

    /**
     * @brief 各语言的执行次数
     */
    std::map<std::string, std::size_t> language_usage() const;

    /**
     * @code{.json}
     * {
     *     "total_executions": 10,
     *     "successful_executions": 8,
     *     "success_rate": 80.0,
     *     "language_usage": {"python": 7, "cpp": 3},
     *     "results": {"success": 8, "timeout": 2}
     * }
     * @endcode
     */
    nlohmann::json report() const;

private:
    mutable std::mutex mut;
    std::size_t total = 0;
    std::size_t successful = 0;
    std::map<std::string, std::size_t> languages;
    std::map<status, std::size_t> results;
};

}  // namespace runbox
