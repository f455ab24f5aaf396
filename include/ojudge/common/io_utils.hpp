#pragma once

#include <filesystem>
#include <string>

namespace ojudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 将 content 写入文件，覆盖原有内容
 * @throw workspace_error 如果文件无法打开或者写入失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 尽力将字节串按 UTF-8 解码，非法的字节序列替换为 U+FFFD
 * 选手程序的输出没有编码保证，比较和报告之前需要先修复
 */
std::string utf8_sanitize(const std::string &string);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 题目编号会被拼接进测试数据的路径，如果拿到的编号包含 "../" 或者
 * 路径分隔符，那么有可能读到测试数据目录以外的文件。
 * @param subpath 被检查的文件名
 * @return subpath 本身
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace ojudge
