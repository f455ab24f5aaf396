#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include "ojudge/language.hpp"

/**
 * 这个头文件包含执行器的输入和输出
 * 包含：
 * 1. execution_request 类（表示一次执行请求）
 * 2. execution_outcome 类（表示一次执行的结果，是下面几种情况之一）
 */
namespace ojudge {

/**
 * @brief 同一次评测的所有测试点共享的编译结果
 * 由执行器创建，评测器持有，评测结束时销毁并删除编译产物。
 * 只在一个 worker 内使用，不需要加锁
 */
struct build_cache {
    virtual ~build_cache() = default;
};

/**
 * @brief 一次执行请求
 * 评测时每个测试点都会创建一个执行请求，执行器同步处理，不会被持久化
 */
struct execution_request {
    language lang;

    /**
     * @brief 选手的源代码
     */
    std::string source_code;

    /**
     * @brief 喂给选手程序 stdin 的内容，可以为空
     */
    std::string stdin_payload;

    /**
     * @brief 覆盖语言默认的运行时间限制，只影响运行阶段，不影响编译阶段
     */
    std::optional<std::chrono::milliseconds> timeout_override;

    /**
     * @brief 复用的编译结果，为空时本次执行单独编译
     * 同一个 build_cache 只能用于同一份源代码
     */
    build_cache *build = nullptr;
};

enum class execution_phase {
    COMPILE,
    RUN
};

const char *get_display_message(execution_phase phase);

namespace outcome {

/**
 * @brief 程序正常运行并以返回码 0 退出
 */
struct success {
    std::string stdout_text;
};

/**
 * @brief 编译器返回非零，message 为编译器的错误输出
 */
struct compile_error {
    std::string message;
};

/**
 * @brief 程序以非零返回码退出或者因为信号崩溃
 * message 为程序的 stderr 输出，只用于展示，不影响评测结果
 */
struct runtime_error {
    std::string message;
    int exit_code;
};

/**
 * @brief 编译或运行超出时间限制
 */
struct timeout {
    execution_phase phase;
};

/**
 * @brief 找不到语言需要的编译器或者解释器
 */
struct toolchain_unavailable {
    language lang;
};

/**
 * @brief 执行器内部发生了无法归类的错误，比如文件系统错误、fork 失败
 */
struct internal_fault {
    std::string message;
};

}  // namespace outcome

/**
 * @brief 一次执行的结果，恰好是其中一种情况
 * 执行器和评测器之间的约定，返回之后不会再被修改
 */
using execution_outcome = std::variant<outcome::success,
                                       outcome::compile_error,
                                       outcome::runtime_error,
                                       outcome::timeout,
                                       outcome::toolchain_unavailable,
                                       outcome::internal_fault>;

/**
 * @brief 执行结果的简短描述，比如 "Success"、"Timeout"，用于日志
 */
std::string describe(const execution_outcome &result);

void to_json(nlohmann::json &j, const execution_outcome &result);

}  // namespace ojudge
