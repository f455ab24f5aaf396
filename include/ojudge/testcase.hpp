#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace ojudge {

/**
 * @brief 一个测试点
 */
struct test_case {
    /**
     * @brief 喂给选手程序的输入，已去掉首尾空白
     */
    std::string input;

    /**
     * @brief 期望的输出，已去掉首尾空白
     */
    std::string expected_output;

    /**
     * @brief 测试点的执行顺序，从 1 开始
     */
    int ordinal;

    bool operator==(const test_case &other) const;
};

std::ostream &operator<<(std::ostream &os, const test_case &tc);

/**
 * @brief 测试数据的组织格式
 * 历史上题目的测试数据没有统一的格式，这里按优先级列出支持的格式
 */
enum class corpus_format {
    /**
     * @brief 测试点之间用空行分隔，每个测试点可以有多行
     */
    BLANK_LINE_SECTIONS,

    /**
     * @brief 每一行是一个测试点
     */
    ONE_LINE_PER_CASE,

    /**
     * @brief 输入的第一行是测试点数量 N，剩下的行平均分给 N 个测试点
     */
    COUNT_PREFIXED,

    /**
     * @brief 整个输入和输出作为一个测试点
     */
    SINGLE_CASE
};

const char *get_display_message(corpus_format format);

/**
 * @brief 测试数据解析器
 * 将题目的输入、输出两段文本解析为有序的测试点列表。
 * 按固定的优先级尝试各种格式，第一个测试点数量一致的格式胜出，
 * 解析结果只取决于输入，对同样的文本总是返回同样的测试点列表。
 */
struct test_case_loader {
    /**
     * @brief 检测测试数据的格式
     * @param raw_inputs 所有测试点的输入
     * @param raw_outputs 所有测试点的期望输出
     */
    corpus_format detect_format(const std::string &raw_inputs, const std::string &raw_outputs) const;

    /**
     * @brief 解析测试数据，不会失败
     * 无法识别格式时整个输入、输出作为一个测试点
     * @return 按 ordinal 升序排列的测试点
     */
    std::vector<test_case> parse(const std::string &raw_inputs, const std::string &raw_outputs) const;
};

}  // namespace ojudge
