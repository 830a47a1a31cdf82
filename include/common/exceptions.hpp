#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace runbox {

struct runbox_exception : std::exception {
    runbox_exception();
    explicit runbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const runbox_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行引擎的内部错误
 * 一般是宿主环境的问题（比如管道、fork 失败），不是用户代码的问题
 */
struct internal_error : public runbox_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示无法准备工作目录（磁盘已满、没有权限等）
 * 抛出该异常时保证不会启动任何容器，且已经创建的目录会被删除
 */
struct workspace_error : public runbox_exception {
    explicit workspace_error(const std::string &message);
};

/**
 * @brief 表示调用者的请求不合法
 * 这类错误在创建工作目录、启动容器之前就会被抛出，
 * 因此抛出时不会遗留任何文件或进程
 */
struct request_error : public runbox_exception {
    explicit request_error(const std::string &message);
};

/**
 * @brief 请求的语言没有在语言表中注册
 */
struct unsupported_language : public request_error {
    const std::string language;

    explicit unsupported_language(const std::string &language);
};

/**
 * @brief 提交的代码超过了允许的最大字节数
 */
struct payload_too_large : public request_error {
    const std::size_t size, limit;

    payload_too_large(std::size_t size, std::size_t limit);
};

/**
 * @brief 请求内容不合法，比如代码为空、时间限制不是正数
 */
struct invalid_request : public request_error {
    explicit invalid_request(const std::string &message);
};

/**
 * @brief 同时执行的任务数已达上限，且准入策略为拒绝
 */
struct capacity_exceeded : public request_error {
    explicit capacity_exceeded(std::size_t limit);
};

}  // namespace runbox
