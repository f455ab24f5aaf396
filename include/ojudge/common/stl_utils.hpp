#pragma once

#include <string>
#include <vector>

namespace ojudge {

/**
 * @brief 判断 s 是否为一个不带符号的十进制整数
 */
bool is_integer(const std::string &s);

/**
 * @brief 按 delim 切分字符串，保留空串
 * @code{.cpp}
 *     split("a\n\nb", '\n') == {"a", "", "b"}
 * @endcode
 */
std::vector<std::string> split(const std::string &s, char delim);

/**
 * @brief 去掉字符串首尾的空白字符
 */
std::string trim(const std::string &s);

/**
 * @brief 去掉字符串末尾的空白字符
 */
std::string trim_right(const std::string &s);

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;

}  // namespace ojudge
