#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "sandbox/language.hpp"
#include "sandbox/workspace.hpp"

namespace runbox {

/**
 * @brief 工作目录在容器内的挂载路径
 */
inline const std::string MOUNT_PATH = "/app";

/**
 * @brief 容器的资源上限
 * 只能由运维在配置中设置，单个请求无法修改。
 */
struct container_limits {
    /**
     * @brief 内存上限，单位 MB，同时也是内存加交换区的上限，即禁用交换区
     */
    std::size_t memory_limit_mb = 128;

    /**
     * @brief 可以使用的 CPU 核心数
     */
    double cpus = 0.5;

    /**
     * @brief stdout 和 stderr 各自最多保留的字节数，超出部分被丢弃
     */
    std::size_t output_limit = 1 << 20;

    /**
     * @brief 超时后先发送 SIGTERM，等待该时长后再发送 SIGKILL
     */
    std::chrono::milliseconds kill_delay{100};

    /**
     * @brief 超时后删除容器（docker rm --force）最多等待的时长，
     * 容器运行时的服务无响应时 execute 也能在有限时间内返回
     */
    std::chrono::milliseconds removal_timeout{5000};
};

/**
 * @brief 容器运行时进程的原始运行结果
 * spawn_error 和 terminated_by_timeout 与返回码相互独立：
 * 1. spawn_error 非空：容器运行时无法执行，或者运行时报告其服务不可用；
 * 2. terminated_by_timeout：超出时间限制，进程已被强制终止；
 * 3. 其他情况：进程正常结束，exit_code 为返回码，被信号杀死时为 128 + 信号编号。
 */
struct raw_process_outcome {
    std::optional<int> exit_code;
    std::string stdout_data;
    std::string stderr_data;
    /**
     * @brief 时钟时间，超时的情况下为检测到超时的时刻，不包括终止进程和删除容器的耗时
     */
    std::chrono::milliseconds elapsed{0};
    bool terminated_by_timeout = false;
    std::optional<std::string> spawn_error;
};

/**
 * @brief 构建并执行沙箱容器
 *
 * 每次调用 execute 只会启动一个容器，调用线程会阻塞到容器结束或者超时为止。
 * 容器的安全配置是固定的：
 * 1. --memory、--memory-swap 相同，限制内存并禁用交换区
 * 2. --cpus 限制 CPU
 * 3. --network=none 禁止网络访问
 * 4. --cap-drop=ALL 及 --security-opt no-new-privileges 禁止提权
 * 5. --rm 容器结束后自动删除
 * 6. 工作目录以只读方式挂载到 MOUNT_PATH
 *
 * 超时后，先终止运行时客户端所在的整个进程组，再通过容器运行时强制删除容器
 * （--rm 并不能保证仍在运行的容器被终止），删除最多等待 removal_timeout，
 * 因此 execute 最晚在 timeout + kill_delay + 2 * removal_timeout 后返回。
 *
 * container_invoker 不保存任何可变状态，可以被多个线程同时使用。
 */
struct container_invoker {
    /**
     * @param runtime 容器运行时的可执行文件，比如 docker，不含目录时从 PATH 中查找
     * @param limits 容器的资源上限
     */
    container_invoker(const std::filesystem::path &runtime, const container_limits &limits);

    /**
     * @brief 在容器中执行工作目录中的程序
     * @param ws 工作目录，将以只读方式挂载进容器
     * @param profile 语言配置，决定镜像和执行命令
     * @param timeout 时钟时间限制
     * @return 原始运行结果，执行失败不会抛出异常，而是通过 spawn_error 表示
     * @throw internal_error 创建管道、fork 失败等宿主机错误，抛出前会清理已启动的进程
     */
    raw_process_outcome execute(const workspace &ws, const language_profile &profile, std::chrono::milliseconds timeout) const;

    /**
     * @brief 构造启动容器的完整命令行
     * @param ws 工作目录
     * @param profile 语言配置
     * @param container_name 容器名，用于超时时删除容器
     * @return 命令行，argv[0] 为容器运行时
     */
    std::vector<std::string> build_command(const workspace &ws, const language_profile &profile, const std::string &container_name) const;

    /**
     * @brief 检查容器运行时是否可用（能否执行 `docker --version`）
     */
    bool runtime_available() const;

private:
    /**
     * @brief 强制删除容器（即使容器仍在运行），最多等待 removal_timeout
     * @return 是否确认删除成功
     */
    bool remove_container(const std::string &container_name) const;

    /**
     * @brief 判断返回码 125 是否是容器运行时自身的错误（而不是用户程序的返回码）
     */
    bool is_runtime_failure(int exit_code, const std::string &stderr_data) const;

    std::filesystem::path runtime;
    container_limits limits;
};

}  // namespace runbox
