#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * 在离开当前作用域时执行一段代码，不论是正常返回还是抛出异常
 * @code{.cpp}
 *     int fd = open(path, O_RDONLY);
 *     defer { close(fd); };
 * @endcode
 */
#define defer auto DEFER_0(_defered_option) = ojudge::scoped_guard() + [&]

namespace ojudge {

struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace ojudge
