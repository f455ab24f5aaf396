#pragma once

#include <filesystem>
#include "ojudge/language.hpp"

/**
 * 测试环境
 * 所有测试共享一个工作目录的父目录，以便检查工作目录是否被删除
 */
namespace ojudge {

void setup_test_environment();

void teardown_test_environment();

/**
 * @brief 本机是否安装了语言需要的编译器和解释器
 * 依赖真实工具链的测试在工具链不存在时跳过
 */
bool has_toolchain(language lang);

/**
 * @brief 统计 WORKSPACE_DIR 下残留的工作目录数量
 */
std::size_t count_workspaces();

}  // namespace ojudge
