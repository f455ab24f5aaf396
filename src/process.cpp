#include "ojudge/process.hpp"
#include <errno.h>
#include <limits.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <system_error>
#include <thread>
#include "ojudge/common/defer.hpp"
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/utils.hpp"

namespace ojudge {
using namespace std;

// 轮询子进程状态的间隔，不可以忙等，否则会挤占选手程序的执行时间
static const chrono::milliseconds poll_interval(10);

bool process_result::success() const {
    return !spawn_failed && !timed_out && exited && exit_code == 0;
}

static string error_message(int err) {
    return generic_category().message(err);
}

static int open_redirect(const filesystem::path &path, bool input) {
    const char *name = path.empty() ? "/dev/null" : path.c_str();
    int fd;
    if (input || path.empty())
        fd = open(name, (input ? O_RDONLY : O_WRONLY) | O_CLOEXEC);
    else
        fd = open(name, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0)
        throw process_error(fmt::format("unable to open {}: {}", name, error_message(errno)));
    return fd;
}

/**
 * @brief 关闭 [first, last] 范围内小于 open_max 的文件描述符
 * 优先使用 close_range，内核不支持时逐个关闭。只调用异步信号安全的函数
 */
static void close_fds(unsigned first, unsigned last, long open_max) {
    if (first > last) return;
#ifdef SYS_close_range
    if (syscall(SYS_close_range, first, last, 0) == 0) return;
#endif
    for (long fd = first; fd <= (long)last && fd < open_max; ++fd)
        close((int)fd);
}

/**
 * @brief 关闭除了标准输入输出和 keep 以外的所有文件描述符
 * 其他 worker 用 fstream 打开的文件没有 FD_CLOEXEC，不关闭会被选手程序继承
 */
static void close_inherited_fds(int keep, long open_max) {
    if (keep > STDERR_FILENO + 1)
        close_fds(STDERR_FILENO + 1, keep - 1, open_max);
    close_fds(keep + 1, UINT_MAX, open_max);
}

/**
 * @brief 子进程中执行的部分
 * fork 之后的多线程程序只能调用异步信号安全的函数，因此这里不能分配内存，也不能打日志。
 * 失败时将 errno 写入 error_pipe 并退出，父进程据此判断程序是否成功启动。
 */
[[noreturn]] static void exec_child(const process_options &opt, char *const *argv, const int fds[3], int error_pipe, long open_max) {
    // 将子进程分离到一个独立的进程组，以便我们通过 kill(-pid) 可以杀死进程组内所有进程
    setpgid(0, 0);

    sigset_t mask;
    sigemptyset(&mask);
    sigprocmask(SIG_SETMASK, &mask, nullptr);
    signal(SIGPIPE, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    signal(SIGXFSZ, SIG_DFL);

    struct rlimit lim;
    if (opt.file_limit >= 0) {
        lim.rlim_cur = lim.rlim_max = (rlim_t)opt.file_limit;
        setrlimit(RLIMIT_FSIZE, &lim);
    }
    if (opt.proc_limit > 0) {
        lim.rlim_cur = lim.rlim_max = (rlim_t)opt.proc_limit;
        setrlimit(RLIMIT_NPROC, &lim);
    }
    lim.rlim_cur = lim.rlim_max = 0;
    setrlimit(RLIMIT_CORE, &lim);

    int err = 0;
    if (!opt.working_dir.empty() && chdir(opt.working_dir.c_str()) != 0) {
        err = errno;
    } else {
        for (int i = 0; i < 3 && !err; ++i) {
            if (fds[i] == i) {
                // dup2 相同的 fd 不会清除 FD_CLOEXEC
                if (fcntl(i, F_SETFD, 0) < 0) err = errno;
            } else if (dup2(fds[i], i) < 0) {
                err = errno;
            }
        }
    }

    if (!err) {
        close_inherited_fds(error_pipe, open_max);
        execvp(argv[0], argv);
        err = errno;
    }

    ssize_t ignored = write(error_pipe, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

/**
 * @brief 等待子进程结束，最多等到 deadline
 * @return 子进程是否已经结束并被回收
 */
static bool wait_until(pid_t pid, int &status, chrono::steady_clock::time_point deadline) {
    while (true) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) return true;
        if (ret < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            kill(-pid, SIGKILL);
            throw process_error(fmt::format("waitpid {} failed: {}", pid, error_message(err)));
        }
        if (chrono::steady_clock::now() >= deadline) return false;
        this_thread::sleep_for(poll_interval);
    }
}

process_result run_process(const process_options &opt) {
    if (opt.argv.empty())
        throw process_error("empty command line");

    vector<char *> argv;
    for (auto &arg : opt.argv)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

#ifndef NDEBUG
    LOG(INFO) << boost::algorithm::join(opt.argv, " ");
#endif

    int fds[3] = {-1, -1, -1};
    defer {
        for (int fd : fds)
            if (fd >= 0) close(fd);
    };
    fds[STDIN_FILENO] = open_redirect(opt.stdin_file, true);
    fds[STDOUT_FILENO] = open_redirect(opt.stdout_file, false);
    fds[STDERR_FILENO] = open_redirect(opt.stderr_file, false);

    int error_pipe[2];
    if (pipe2(error_pipe, O_CLOEXEC) != 0)
        throw process_error("unable to create pipe: " + error_message(errno));

    // sysconf 不是异步信号安全的，在 fork 之前取得
    long open_max = sysconf(_SC_OPEN_MAX);
    if (open_max < 0) open_max = 1024;

    elapsed_time timer;
    pid_t pid;
    switch (pid = fork()) {
        case -1: {  // fork 失败
            int err = errno;
            close(error_pipe[0]);
            close(error_pipe[1]);
            throw process_error("fork failed: " + error_message(err));
        }
        case 0:  // 子进程
            close(error_pipe[0]);
            exec_child(opt, argv.data(), fds, error_pipe[1], open_max);
        default:  // 父进程
            break;
    }

    // 与子进程的 setpgid 竞争，确保之后 kill(-pid) 时进程组已经存在
    setpgid(pid, pid);
    close(error_pipe[1]);

    process_result result;
    int status = 0;

    // execvp 成功时管道因为 FD_CLOEXEC 被关闭，read 返回 0
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(error_pipe[0]);

    if (n == sizeof(child_errno)) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            ;
        result.spawn_failed = true;
        result.spawn_error = fmt::format("unable to execute {}: {}", opt.argv[0], error_message(child_errno));
        result.wall_time = timer.duration<chrono::milliseconds>();
        return result;
    }

    bool finished = wait_until(pid, status, chrono::steady_clock::now() + opt.timeout);
    if (!finished) {
        result.timed_out = true;
        LOG(WARNING) << "Process " << pid << " (" << opt.argv[0] << ") exceeded time limit of "
                     << opt.timeout.count() << "ms, sending SIGTERM to process group";
        kill(-pid, SIGTERM);

        finished = wait_until(pid, status, chrono::steady_clock::now() + opt.grace_period);
        if (!finished) {
            LOG(WARNING) << "Process " << pid << " ignored SIGTERM, sending SIGKILL to process group";
            result.force_killed = true;
            kill(-pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR)
                    throw process_error(fmt::format("waitpid {} failed: {}", pid, error_message(errno)));
            }
        }
    }

    // 主进程已经结束，杀死进程组内残留的进程，确保没有进程在评测结束后继续运行
    if (kill(-pid, SIGKILL) == 0)
        LOG(INFO) << "Killed remaining processes in process group " << pid;

    result.wall_time = timer.duration<chrono::milliseconds>();
    if (WIFEXITED(status)) {
        result.exited = true;
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
    }
    return result;
}

}  // namespace ojudge
