#pragma once

#include <string>
#include "ojudge/language.hpp"

namespace ojudge {

/**
 * @brief 一个选手提交
 * 由外部系统提交，评测期间不会被修改
 */
struct submission {
    /**
     * @brief 选手代码提交的题目 id，同时作为隐藏测试数据的键
     * string 可以兼容一切情况
     */
    std::string problem_id;

    language lang;

    std::string source_code;
};

}  // namespace ojudge
