#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace ojudge {

/**
 * @brief 描述如何运行一个外部程序
 */
struct process_options {
    /**
     * @brief 外部命令的路径 (argv[0]) 和参数
     * argv[0] 不包含 '/' 时通过 PATH 查找
     */
    std::vector<std::string> argv;

    /**
     * @brief 子进程的工作目录，为空时继承当前进程的工作目录
     */
    std::filesystem::path working_dir;

    /**
     * @brief 作为 stdin 的文件，为空时使用 /dev/null
     */
    std::filesystem::path stdin_file;

    /**
     * @brief stdout 重定向到的文件，为空时使用 /dev/null
     */
    std::filesystem::path stdout_file;

    /**
     * @brief stderr 重定向到的文件，为空时使用 /dev/null
     */
    std::filesystem::path stderr_file;

    /**
     * @brief 时钟时间限制
     */
    std::chrono::milliseconds timeout{10000};

    /**
     * @brief 超时后发送 SIGTERM 到 SIGKILL 之间的等待时间
     */
    std::chrono::milliseconds grace_period{5000};

    /**
     * @brief 单个文件的写入大小限制 (RLIMIT_FSIZE)，单位为字节，小于 0 表示不限制
     */
    long file_limit = -1;

    /**
     * @brief 进程数限制 (RLIMIT_NPROC)，小于等于 0 表示不限制
     */
    int proc_limit = -1;
};

/**
 * @brief 外部程序的运行结果
 */
struct process_result {
    /**
     * @brief 子进程是否没能启动（比如 execvp 找不到程序）
     */
    bool spawn_failed = false;

    /**
     * @brief 子进程没能启动的原因
     */
    std::string spawn_error;

    /**
     * @brief 是否因为超出时钟时间限制而被杀死
     */
    bool timed_out = false;

    /**
     * @brief 超时后进程组没有响应 SIGTERM，最终通过 SIGKILL 杀死
     */
    bool force_killed = false;

    /**
     * @brief 子进程是否通过 exit 正常退出
     */
    bool exited = false;

    /**
     * @brief 子进程的返回码，如果因为信号崩溃，则为 128 + 信号值
     */
    int exit_code = -1;

    /**
     * @brief 导致子进程结束的信号，没有则为 -1
     */
    int signal = -1;

    /**
     * @brief 时钟时间
     */
    std::chrono::milliseconds wall_time{0};

    /**
     * @brief 程序正常启动、在时间限制内以返回码 0 退出
     */
    bool success() const;
};

/**
 * @brief 运行外部程序并等待其结束
 * 子进程会被放到独立的进程组中，超时时先向整个进程组发送 SIGTERM，
 * 等待 grace_period 后再向整个进程组发送 SIGKILL，确保选手程序 fork
 * 出来的子进程不会在父进程结束后继续运行。
 * 程序正常结束后也会清理进程组内残留的进程。
 * 
 * @param opt 运行配置
 * @return 运行结果，不会阻塞超过 timeout + grace_period（加上调度误差）
 * @throw process_error 如果无法打开重定向文件、fork 失败或者 waitpid 失败
 */
process_result run_process(const process_options &opt);

}  // namespace ojudge
