#pragma once

#include <ostream>

namespace ojudge {

/**
 * @brief 表示整个提交的最终评测结果
 * 枚举值按照严重程度递增排列，可以直接比较大小
 */
enum class verdict {
    /**
     * @brief 所有测试点均输出正确
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 选手程序正常退出，但是规范化之后的输出和标准输出不一致。
     * 行末空白和文末空行不计入比较，因此不存在格式错误。
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序运行时间超出限制
     * 只比较时钟时间，不对程序距离结束还有多远做任何假设
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序出现运行时错误
     * 退出码非零，或者因为信号而崩溃
     */
    RUNTIME_ERROR = 3,

    /**
     * @brief 用户程序编译错误
     * 编译器的错误信息原样返回
     */
    COMPILATION_ERROR = 4,

    /**
     * @brief 内部错误，评测系统出错
     * 比如找不到编译器、文件系统出错，不是选手的问题，不能当成选手的错误展示
     */
    INTERNAL_ERROR = 5
};

/**
 * @brief 评测结果的展示名称，比如 "Accepted"
 */
const char *get_display_message(verdict);

/**
 * @brief 评测结果的简写，比如 "AC"，与外部系统存储的值一致
 */
const char *get_short_code(verdict);

std::ostream &operator<<(std::ostream &os, verdict v);

}  // namespace ojudge
