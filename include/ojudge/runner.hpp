#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include "ojudge/execution.hpp"
#include "ojudge/language.hpp"
#include "ojudge/toolchain.hpp"
#include "ojudge/workspace.hpp"

namespace ojudge {

/**
 * @brief 执行器，负责编译并运行一次选手程序
 * 评测器只依赖这个接口，测试时可以替换成 mock
 */
struct runner {
    virtual ~runner() = default;

    /**
     * @brief 创建一次评测使用的编译结果缓存
     * 评测器在评测开始时调用，之后每个测试点的 execution_request::build 都指向它，
     * 源代码只在第一个测试点编译一次
     * @return 编译结果缓存，不支持缓存的执行器返回空
     */
    virtual std::unique_ptr<build_cache> open_build_cache() { return nullptr; }

    /**
     * @brief 同步执行一次请求
     * 实现不允许抛出异常，所有的错误都必须转换为 execution_outcome
     * @param request 执行请求
     * @return 执行结果
     */
    virtual execution_outcome run(const execution_request &request) = 0;
};

struct sandbox_build;

/**
 * @brief 基于进程组和临时工作目录的执行器
 * 每次执行：
 * 1. 探测语言的编译器和解释器，创建编译目录并写入源代码，如有需要则编译。
 *    请求带有 build_cache 时这一步只在第一次执行时进行，之后复用结果
 * 2. 创建独占的运行目录
 * 3. 以 stdin 文件运行程序，stdout、stderr 重定向到运行目录中的文件
 * 4. 删除运行目录，编译目录随 build_cache 一起删除
 * 
 * 这个类本身没有可变状态，可以被多个 worker 线程并发调用
 */
struct sandbox_runner : public runner {
    explicit sandbox_runner(const language_table &languages);

    std::unique_ptr<build_cache> open_build_cache() override;

    execution_outcome run(const execution_request &request) override;

private:
    language_table languages;
    toolchain_resolver resolver;

    /**
     * @brief 准备可运行的程序，已经准备过时直接返回之前的结果
     * @return 编译失败或者工具链不可用时的执行结果，准备成功则返回空
     */
    std::optional<execution_outcome> prepare(sandbox_build &build, const execution_request &request);

    execution_outcome run_in(const workspace &ws, const sandbox_build &build, const execution_request &request);

    /**
     * @brief 编译源代码
     * @param source 源文件路径
     * @param artifact 编译产物路径（对于 Java 为空）
     * @return 编译失败时的执行结果，编译成功则返回空
     */
    std::optional<execution_outcome> compile(const workspace &ws, const toolchain &tc, const std::filesystem::path &source, const std::filesystem::path &artifact);
};

}  // namespace ojudge
