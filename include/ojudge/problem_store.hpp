#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ojudge {

/**
 * @brief 一组测试数据的原始文本，尚未切分为测试点
 */
struct corpus {
    std::string inputs;
    std::string outputs;
};

/**
 * @brief 题目测试数据的来源
 * 题目、测试数据由外部系统维护，评测系统只读取
 */
struct problem_store {
    virtual ~problem_store() = default;

    /**
     * @brief 样例测试数据
     * @return 测试数据，如果题目没有样例测试数据则返回空
     * @throw judge_exception 如果题目编号不合法
     */
    virtual std::optional<corpus> visible_corpus(const std::string &problem_id) const = 0;

    /**
     * @brief 隐藏测试数据，一般规模更大，以题目编号为键
     * @return 测试数据，如果题目没有隐藏测试数据则返回空
     * @throw judge_exception 如果题目编号不合法
     */
    virtual std::optional<corpus> hidden_corpus(const std::string &problem_id) const = 0;
};

/**
 * @brief 从本地目录读取测试数据
 * root
 * ├── problems
 * │   └── <problem_id>
 * │       ├── input.txt    // 样例输入
 * │       └── output.txt   // 样例输出
 * ├── inputs
 * │   └── <problem_id>.txt // 隐藏测试数据的输入
 * └── outputs
 *     └── <problem_id>.txt // 隐藏测试数据的输出
 * 输入和输出文件必须同时存在，否则视为没有这组测试数据
 */
struct directory_problem_store : public problem_store {
    explicit directory_problem_store(const std::filesystem::path &root);

    std::optional<corpus> visible_corpus(const std::string &problem_id) const override;

    std::optional<corpus> hidden_corpus(const std::string &problem_id) const override;

private:
    std::filesystem::path root;
};

}  // namespace ojudge
