#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace ojudge {

/**
 * @brief 并发队列，写者读者模型
 * 队列不设上限，push 永远不会阻塞，多余的元素只会在队列中排队等待
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 从队列中弹出队头元素，如果队列为空则最多等待 timeout
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @param timeout 最长等待时间
     * @return 是否成功弹出队列头元素
     */
    template <typename Rep, typename Period>
    bool try_pop_for(T &element, const std::chrono::duration<Rep, Period> &timeout) {
        std::unique_lock<std::mutex> mlock(mut);
        if (!cond.wait_for(mlock, timeout, [this] { return !q.empty(); }))
            return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素
     */
    void push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        q.push(value);
        mlock.unlock();
        cond.notify_one();
    }

private:
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace ojudge
