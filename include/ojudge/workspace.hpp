#pragma once

#include <filesystem>
#include <string>

namespace ojudge {

/**
 * @brief 一次执行独占的临时工作目录
 * 构造时在 root 下创建随机命名的目录，析构时递归删除，不论执行成功、
 * 抛出异常还是超时。删除失败只记录日志，不会影响评测结果。
 */
struct workspace {
    /**
     * @brief 创建工作目录
     * @param root 工作目录的父目录，不存在时会被创建
     * @throw workspace_error 如果目录无法创建
     */
    explicit workspace(const std::filesystem::path &root);

    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;

    ~workspace();

    /**
     * @brief 随机生成的工作目录标识，也用作源文件名
     */
    const std::string &id() const;

    const std::filesystem::path &path() const;

    /**
     * @brief 工作目录下的文件路径
     */
    std::filesystem::path file(const std::string &name) const;

    /**
     * @brief 立即删除工作目录，可以重复调用
     * @return 是否删除成功
     */
    bool release();

private:
    std::string uuid;
    std::filesystem::path dir;
    bool released = false;
};

}  // namespace ojudge
