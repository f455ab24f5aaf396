#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "ojudge/common/verdict.hpp"
#include "ojudge/judge/submission.hpp"
#include "ojudge/problem_store.hpp"
#include "ojudge/runner.hpp"
#include "ojudge/testcase.hpp"

namespace ojudge {

/**
 * @brief 一组按顺序评测的测试点，比如样例测试数据、隐藏测试数据
 */
struct test_suite {
    /**
     * @brief 测试数据组名，比如 "visible"、"hidden"
     */
    std::string name;

    std::vector<test_case> cases;

    /**
     * @brief 本组测试点的运行时间限制，为空时使用语言默认的时间限制
     */
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * @brief 一个提交的评测结果
 */
struct judge_result {
    verdict result = verdict::ACCEPTED;

    /**
     * @brief 第一个失败的测试点的错误信息
     * 编译错误时为编译器的输出，运行时错误时为程序的 stderr
     */
    std::string message;

    /**
     * @brief 第一个失败的测试点的 ordinal，通过时为空
     */
    std::optional<int> failed_case;

    /**
     * @brief 第一个失败的测试点所在的测试数据组名
     */
    std::string failed_suite;

    /**
     * @brief 实际调用执行器的次数
     * 评测在第一个失败的测试点处停止，因此可能小于测试点总数
     */
    std::size_t cases_run = 0;
};

void to_json(nlohmann::json &j, const judge_result &result);

/**
 * @brief 规范化程序输出用于比较
 * 统一换行符为 \n，去掉每行行末的空白字符，去掉开头和结尾的空行。
 * 行首的空白字符会保留。选手输出和期望输出使用同样的规则
 */
std::string normalize_output(const std::string &text);

/**
 * @brief 评测器，驱动执行器逐个运行测试点并得到最终评测结果
 * 评测器本身没有状态，执行器和测试数据解析器都由调用方传入
 */
struct evaluator {
    /**
     * @brief 按顺序评测所有测试数据组
     * 每组内按 ordinal 升序评测，遇到第一个失败的测试点立即停止，不再运行剩下的测试点。
     * 所有测试数据组共享一个 build_cache，源代码只编译一次
     * @param exec 执行器
     * @param submit 选手提交
     * @param suites 测试数据组，按顺序评测
     * @return 评测结果，不会抛出异常
     */
    judge_result judge(runner &exec, const submission &submit, const std::vector<test_suite> &suites) const;

    /**
     * @brief 从题目的测试数据评测提交，先评测样例测试数据，再评测隐藏测试数据
     * @return 评测结果，不会抛出异常。题目没有任何测试数据时返回内部错误
     */
    judge_result judge(runner &exec, const test_case_loader &loader, const problem_store &store, const submission &submit) const;
};

}  // namespace ojudge
