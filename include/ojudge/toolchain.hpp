#pragma once

#include <optional>
#include <string>
#include <vector>
#include "ojudge/language.hpp"

namespace ojudge {

/**
 * @brief 探测到的一种语言的编译器和解释器
 */
struct toolchain {
    language lang;

    /**
     * @brief 编译器路径，没有编译步骤的语言为空
     */
    std::string compiler;

    /**
     * @brief 解释器或虚拟机路径，直接运行编译产物的语言为空
     */
    std::string runtime;
};

/**
 * @brief 查找每种语言可用的编译器和解释器
 * 每次调用都会重新探测，不缓存结果，因为运行环境可能随时变化
 */
struct toolchain_resolver {
    explicit toolchain_resolver(const language_table &languages);

    /**
     * @brief 按顺序探测候选程序，返回第一个探测成功的工具链
     * @param lang 要探测的语言
     * @return 工具链，如果有任意一个需要的程序找不到则返回空
     */
    std::optional<toolchain> resolve(language lang) const;

    /**
     * @brief 在 candidates 中查找第一个以 probe_args 运行能以返回码 0 退出的程序
     * @return 探测成功的程序，或者空
     */
    static std::optional<std::string> probe(const std::vector<std::string> &candidates, const std::vector<std::string> &probe_args);

private:
    language_table languages;
};

}  // namespace ojudge
