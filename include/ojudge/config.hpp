#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "ojudge/language.hpp"

namespace ojudge {

/**
 * @brief 存放工作目录的父目录
 * 每次执行都会在这里创建一个随机命名的工作目录，执行结束后立刻删除。
 * 若将这个文件夹放进内存盘，可以加速选手程序的 IO 性能。
 * @defaultValue 系统临时目录
 * 
 * WORKSPACE_DIR
 * ├── ojudge-2f1c...  // 随机生成的 uuid
 * │   ├── 2f1c....cpp // 选手程序的源代码
 * │   ├── 2f1c...     // 编译产物（对于 C、C++）
 * │   ├── stdin       // 喂给选手程序的输入
 * │   ├── stdout      // 选手程序的 stdout 输出
 * │   ├── stderr      // 选手程序的 stderr 输出
 * │   ├── compile.out // 编译器的 stdout 输出
 * │   └── compile.err // 编译器的 stderr 输出
 * └── ...
 */
extern std::filesystem::path WORKSPACE_DIR;

/**
 * @brief 探测编译器、解释器是否可用的时间限制
 */
extern std::chrono::milliseconds PROBE_TIMEOUT;

/**
 * @brief 超时后发送 SIGTERM 到发送 SIGKILL 之间的等待时间
 */
extern std::chrono::milliseconds KILL_GRACE_PERIOD;

/**
 * @brief 隐藏测试数据组的运行时间限制，为 0 时使用语言默认的时间限制
 */
extern std::chrono::milliseconds HIDDEN_RUN_TIMEOUT;

/**
 * @brief 选手程序和编译器单个输出文件的大小限制，单位为字节
 * 超出限制时进程会收到 SIGXFSZ
 */
extern long OUTPUT_LIMIT;

/**
 * @brief 选手程序所属用户的进程数限制，小于等于 0 表示不限制
 * 注意 RLIMIT_NPROC 是按用户统计的，评测系统和选手程序使用同一个用户运行时
 * 需要留出评测系统自身的线程数
 */
extern int PROC_LIMIT;

/**
 * @brief 同时评测的提交数量
 */
extern std::size_t WORKER_COUNT;

/**
 * @brief 从配置文件加载全局配置以及语言配置
 * 配置文件中没有出现的项保持原值
 * @code{.json}
 * {
 *     "workspace_dir": "/tmp/ojudge",
 *     "workers": 4,
 *     "probe_timeout": 5,
 *     "kill_grace_period": 5,
 *     "hidden_run_timeout": 20,
 *     "output_limit": 67108864,
 *     "proc_limit": -1,
 *     "languages": { "cpp": { "run_timeout": 5 } }
 * }
 * @endcode
 * @throw judge_exception 如果配置文件格式错误
 */
void load_config(const nlohmann::json &j, language_table &languages);

}  // namespace ojudge
