#pragma once

#include <map>
#include "ojudge/problem_store.hpp"

namespace ojudge::mock {

/**
 * @brief 测试用的题目测试数据，保存在内存中
 */
struct memory_problem_store : public problem_store {
    std::map<std::string, corpus> visible, hidden;

    std::optional<corpus> visible_corpus(const std::string &problem_id) const override {
        auto it = visible.find(problem_id);
        if (it == visible.end()) return {};
        return it->second;
    }

    std::optional<corpus> hidden_corpus(const std::string &problem_id) const override {
        auto it = hidden.find(problem_id);
        if (it == hidden.end()) return {};
        return it->second;
    }
};

}  // namespace ojudge::mock
