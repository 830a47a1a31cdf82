#include "sandbox/container.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace runbox {
using namespace std;
namespace fs = std::filesystem;

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

// child_pipefd[EXEC_REPORT] 用于子进程报告 execvp 的失败原因
const int EXEC_REPORT = 0;

const int POLL_INTERVAL_MS = 50;

const chrono::seconds RUNTIME_CHECK_TIMEOUT(5);

// docker run 在自身出错（比如无法连接 docker 服务、镜像不存在）时的返回码
const int RUNTIME_ERROR_EXIT_CODE = 125;

/**
 * @brief 宿主机上的系统调用失败，与用户代码无关
 */
[[noreturn]] static void host_error(int errnum, const string &action) {
    throw internal_error(fmt::format("{}: {}", action, strerror(errnum)));
}

static void close_fd(int &fd) {
    if (fd < 0) return;
    close(fd);
    fd = -1;
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        host_error(errno, "fcntl, setting O_NONBLOCK");
}

/**
 * @brief 读取管道中当前可读的全部数据，读到 EOF 时关闭管道
 * 超出 limit 的数据被读出后丢弃，避免子进程因管道写满而阻塞
 */
static void pump_pipe(int &fd, string &buffer, size_t limit) {
    char buf[BUF_SIZE];
    while (fd >= 0) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            if (buffer.size() < limit)
                buffer.append(buf, min((size_t)n, limit - buffer.size()));
        } else if (n == 0) {
            close_fd(fd);
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        } else {
            LOG(WARNING) << "reading child output: " << strerror(errno);
            close_fd(fd);
        }
    }
}

static void wait_child(pid_t pid, int &status) {
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            host_error(errno, "waiting on child");
    }
}

static int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        LOG(WARNING) << "Command terminated with signal (" << sig << ", " << strsignal(sig) << ")";
        return 128 + sig;
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", status));
    }
}

/**
 * @brief 终止整个进程组，先尝试 SIGTERM，等待 delay 后再 SIGKILL
 * 已经结束的进程组不视为错误。
 */
static void terminate_process_group(pid_t pgid, chrono::milliseconds delay) {
    struct timespec killdelay;
    killdelay.tv_sec = delay.count() / 1000;
    killdelay.tv_nsec = (delay.count() % 1000) * 1000000L;

    LOG(INFO) << "sending SIGTERM";
    if (kill(-pgid, SIGTERM) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGTERM to process group " << pgid << ": " << strerror(errno);

    nanosleep(&killdelay, nullptr);

    LOG(INFO) << "sending SIGKILL";
    if (kill(-pgid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGKILL to process group " << pgid << ": " << strerror(errno);
}

container_invoker::container_invoker(const fs::path &runtime, const container_limits &limits)
    : runtime(runtime), limits(limits) {}

vector<string> container_invoker::build_command(const workspace &ws, const language_profile &profile, const string &container_name) const {
    // clang-format off
    vector<string> cmd = {
        runtime.string(), "run",
        "--rm",
        "--name", container_name,
        fmt::format("--memory={}m", limits.memory_limit_mb),
        fmt::format("--memory-swap={}m", limits.memory_limit_mb),
        fmt::format("--cpus={}", limits.cpus),
        "--network=none",
        "--cap-drop=ALL",
        "--security-opt", "no-new-privileges",
        "-v", fmt::format("{}:{}:ro", ws.directory().string(), MOUNT_PATH),
        profile.image
    };
    // clang-format on
    auto command = profile.expand_command(MOUNT_PATH);
    cmd.insert(cmd.end(), command.begin(), command.end());
    return cmd;
}

raw_process_outcome container_invoker::execute(const workspace &ws, const language_profile &profile, chrono::milliseconds timeout) const {
    string container_name = "runbox-" + boost::lexical_cast<string>(boost::uuids::random_generator()());
    vector<string> cmd = build_command(ws, profile, container_name);
    vector<char *> args;
    for (auto &arg : cmd) args.push_back(arg.data());
    args.push_back(nullptr);

    raw_process_outcome outcome;

    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    defer {
        for (auto &fds : child_pipefd) {
            close_fd(fds[PIPE_IN]);
            close_fd(fds[PIPE_OUT]);
        }
    };
    for (auto &fds : child_pipefd)
        if (pipe2(fds, O_CLOEXEC) != 0)
            host_error(errno, "creating pipes");

    LOG(INFO) << "starting container " << container_name << " with image " << profile.image;

    elapsed_time timer;
    pid_t child_pid;
    switch (child_pid = fork()) {
        case -1:
            host_error(errno, "unable to fork");
        case 0: {  // child process, run the container runtime
            // 子进程自成一个进程组，超时时可以一次性终止运行时及其创建的所有进程
            setpgid(0, 0);

            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) dup2(devnull, STDIN_FILENO);

            // 将管道连接到 stdout/stderr，dup2 得到的描述符不带 O_CLOEXEC
            for (int i = 1; i <= 2; ++i)
                dup2(child_pipefd[i][PIPE_IN], i);

            signal(SIGINT, SIG_DFL);
            signal(SIGPIPE, SIG_DFL);
            sigset_t emptymask;
            sigemptyset(&emptymask);
            sigprocmask(SIG_SETMASK, &emptymask, nullptr);

            execvp(args[0], args.data());

            // exec 失败，通过管道将 errno 告诉父进程
            int err = errno;
            if (write(child_pipefd[EXEC_REPORT][PIPE_IN], &err, sizeof(err)) < 0) _exit(126);
            _exit(127);
        }
        default:  // watchdog
            break;
    }

    // 与子进程中的 setpgid 竞争，任意一方成功即可
    setpgid(child_pid, child_pid);

    int status = 0;
    bool reaped = false;
    defer {
        // 只有在抛出异常时才会执行到这里：确保不残留进程和容器
        if (reaped) return;
        LOG(ERROR) << "aborting container " << container_name << " due to previous error";
        kill(-child_pid, SIGKILL);
        int ignored;
        wait_child(child_pid, ignored);
        remove_container(container_name);
    };

    for (auto &fds : child_pipefd)
        close_fd(fds[PIPE_IN]);

    {
        // 若 exec 成功，O_CLOEXEC 会关闭写端，read 返回 0
        int err = 0;
        ssize_t n;
        while ((n = read(child_pipefd[EXEC_REPORT][PIPE_OUT], &err, sizeof(err))) < 0 && errno == EINTR)
            ;
        if (n == (ssize_t)sizeof(err)) {
            wait_child(child_pid, status);
            reaped = true;
            outcome.elapsed = chrono::round<chrono::milliseconds>(timer.duration<chrono::microseconds>());
            outcome.spawn_error = fmt::format("Unable to execute container runtime {}: {}", runtime.string(), strerror(err));
            LOG(ERROR) << *outcome.spawn_error;
            return outcome;
        }
        close_fd(child_pipefd[EXEC_REPORT][PIPE_OUT]);
    }

    for (int i = 1; i <= 2; ++i)
        set_nonblocking(child_pipefd[i][PIPE_OUT]);

    auto pump_all = [&]() {
        pump_pipe(child_pipefd[STDOUT_FILENO][PIPE_OUT], outcome.stdout_data, limits.output_limit);
        pump_pipe(child_pipefd[STDERR_FILENO][PIPE_OUT], outcome.stderr_data, limits.output_limit);
    };

    bool exited = false;
    while (true) {
        if (!exited) {
            pid_t pid = waitpid(child_pid, &status, WNOHANG);
            if (pid == child_pid)
                exited = reaped = true;
            else if (pid < 0 && errno != EINTR)
                host_error(errno, "waiting on child");
        }

        bool pipes_open = child_pipefd[STDOUT_FILENO][PIPE_OUT] >= 0 || child_pipefd[STDERR_FILENO][PIPE_OUT] >= 0;
        if (exited && !pipes_open) break;

        auto remaining = timeout - timer.duration<chrono::milliseconds>();
        if (remaining <= chrono::milliseconds::zero()) {
            if (!exited) {
                LOG(WARNING) << "timelimit exceeded (hard wall time): aborting container " << container_name;
                outcome.terminated_by_timeout = true;
                outcome.elapsed = chrono::round<chrono::milliseconds>(timer.duration<chrono::microseconds>());
                // 先终止客户端，清理耗时不依赖于容器运行时服务的响应速度
                terminate_process_group(child_pid, limits.kill_delay);
                wait_child(child_pid, status);
                exited = reaped = true;
                // 容器由运行时的服务进程管理，终止客户端并不能终止容器。
                // 容器可能在第一次删除时还没有被创建出来，因此失败时再删除一次
                if (!remove_container(container_name) && !remove_container(container_name))
                    LOG(ERROR) << "unable to confirm removal of container " << container_name << ", it may still be running";
            } else {
                // 运行时已经结束，但它遗留的进程仍然持有输出管道
                LOG(WARNING) << "killing processes left behind by container runtime " << child_pid;
                if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
                    LOG(WARNING) << "unable to send SIGKILL to process group " << child_pid << ": " << strerror(errno);
            }
            pump_all();
            break;
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        for (int i = 1; i <= 2; ++i) {
            if (child_pipefd[i][PIPE_OUT] >= 0) {
                fds[nfds].fd = child_pipefd[i][PIPE_OUT];
                fds[nfds].events = POLLIN;
                ++nfds;
            }
        }

        int wait_ms = (int)min<long long>(remaining.count(), POLL_INTERVAL_MS);
        if (nfds > 0) {
            if (poll(fds, nfds, wait_ms) < 0 && errno != EINTR)
                host_error(errno, "waiting for child data");
        } else {
            struct timespec interval = {0, wait_ms * 1000000L};
            nanosleep(&interval, nullptr);
        }

        pump_all();
    }

    if (!outcome.terminated_by_timeout) {
        outcome.elapsed = chrono::round<chrono::milliseconds>(timer.duration<chrono::microseconds>());
        int exitcode = decode_status(status);
        outcome.exit_code = exitcode;
        if (is_runtime_failure(exitcode, outcome.stderr_data))
            outcome.spawn_error = trim(outcome.stderr_data);
    }

    LOG(INFO) << fmt::format("container {} finished in {}ms, exitcode: {}, timeout: {}",
                             container_name, outcome.elapsed.count(),
                             outcome.exit_code ? to_string(*outcome.exit_code) : "none",
                             outcome.terminated_by_timeout);
    return outcome;
}

bool container_invoker::runtime_available() const {
    try {
        return call_process_timeout(RUNTIME_CHECK_TIMEOUT, runtime, "--version") == 0;
    } catch (system_error &ex) {
        LOG(WARNING) << "Unable to check container runtime " << runtime << ": " << ex.what();
        return false;
    }
}

bool container_invoker::remove_container(const string &container_name) const {
    int ret;
    try {
        ret = call_process_timeout(limits.removal_timeout, runtime, "rm", "--force", container_name);
    } catch (system_error &ex) {
        LOG(WARNING) << "unable to remove container " << container_name << ": " << ex.what();
        return false;
    }
    if (ret == EXEC_TIMED_OUT)
        LOG(WARNING) << "removing container " << container_name << " did not finish in " << limits.removal_timeout.count() << "ms";
    else if (ret != 0)
        LOG(WARNING) << "unable to remove container " << container_name << ", exitcode: " << ret;
    return ret == 0;
}

bool container_invoker::is_runtime_failure(int exit_code, const string &stderr_data) const {
    if (exit_code != RUNTIME_ERROR_EXIT_CODE) return false;
    // 用户程序也可能以 125 退出，因此还需要检查错误信息是否由容器运行时输出
    return boost::algorithm::starts_with(stderr_data, runtime.filename().string() + ":") ||
           boost::algorithm::contains(stderr_data, "Cannot connect to the Docker daemon") ||
           boost::algorithm::contains(stderr_data, "Error response from daemon");
}

}  // namespace runbox
