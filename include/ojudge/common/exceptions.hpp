#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace ojudge {

struct judge_exception : std::exception {
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    template <typename T>
    judge_exception operator<<(const T &t) const {
        return judge_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是运行环境的问题，比如找不到编译器，而不是选手代码的问题
 */
struct internal_error : public judge_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示工作目录的文件系统错误，比如无法创建目录或者写入源代码
 */
struct workspace_error : public judge_exception {
    explicit workspace_error(const std::string &message);
};

/**
 * @brief 表示创建、等待子进程失败，通常由 fork、pipe、waitpid 产生
 */
struct process_error : public judge_exception {
    explicit process_error(const std::string &message);
};

}  // namespace ojudge
