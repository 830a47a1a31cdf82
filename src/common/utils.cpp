#include "common/utils.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <boost/algorithm/string/trim.hpp>
#include <cerrno>
#include <system_error>
using namespace std;

int exec_program(const char **argv, chrono::milliseconds timeout) {
    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "unable to fork");
        case 0: {  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            int devnull = open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
            execvp(argv[0], (char **)argv);
            _exit(127);
        }
        default: {  // 父进程
            int status;
            elapsed_time timer;
            while (true) {
                pid_t ret = waitpid(pid, &status, timeout > chrono::milliseconds::zero() ? WNOHANG : 0);
                if (ret == pid) break;
                if (ret < 0) {
                    if (errno == EINTR) continue;
                    throw system_error(errno, system_category(), "waiting for child process");
                }
                if (timer.duration<chrono::milliseconds>() >= timeout) {
                    LOG(WARNING) << argv[0] << " did not finish in " << timeout.count() << "ms, killing it";
                    kill(pid, SIGKILL);
                    while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
                        ;
                    return EXEC_TIMED_OUT;
                }
                struct timespec interval = {0, 10 * 1000000L};
                nanosleep(&interval, nullptr);
            }
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
        }
    }
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string trim(const string &str) {
    return boost::algorithm::trim_copy(str);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}
