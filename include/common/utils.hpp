#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> : formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return formatter<std::string>::format(p.string(), ctx);
    }
};
}  // namespace fmt

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 外部命令未能在时限内结束（已被 SIGKILL 终止）时 exec_program 的返回值
 */
const int EXEC_TIMED_OUT = -2;

/**
 * @brief 执行外部命令，并等待其结束
 * 外部命令的 stdout 和 stderr 被重定向到 /dev/null，避免污染本程序的输出
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)，以 nullptr 结尾
 * @param timeout 等待外部命令结束的时限，为 0 时一直等待
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1；
 * 如果外部命令无法执行（比如不存在），返回 127；超出时限返回 EXEC_TIMED_OUT
 */
int exec_program(const char **argv, std::chrono::milliseconds timeout);

/**
 * @brief 调用外部程序，最多等待 timeout
 * @note 与 exec_program(argv) 的区别是，这个函数是类型安全的，而且会自动执行类型转换
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param timeout 等待时限，为 0 时一直等待
 * @param args 转送给应用程序的参数列表，比如可以传入 filesystem::path 给 args[0] 来表示应用程序路径
 * @code{.cpp}
 *     // 相当于 timeout -s KILL 5 docker rm --force runbox-xxx > /dev/null 2>&1
 *     int exitcode = call_process_timeout(std::chrono::seconds(5), "docker", "rm", "--force", "runbox-xxx");
 * @endcode
 */
template <typename... Args>
int call_process_timeout(std::chrono::milliseconds timeout, Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    std::vector<const char *> argv;
    for (auto &arg : list)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

#ifndef NDEBUG
    std::stringstream ss;
    for (size_t i = 0; i < list.size(); ++i)
        ss << argv[i] << ' ';
    LOG(INFO) << ss.str();
#endif

    return exec_program(argv.data(), timeout);
}

template <typename... Args>
int call_process(Args &&... args) {
    return call_process_timeout(std::chrono::milliseconds::zero(), args...);
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 删除字符串首尾的空白字符
 */
std::string trim(const std::string &str);

/**
 * @brief 计时器，使用单调时钟，不受系统时间调整影响
 */
struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};
