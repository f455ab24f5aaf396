#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include "ojudge/common/concurrent_queue.hpp"
#include "ojudge/judge/evaluator.hpp"

/**
 * 评测服务相关类
 * 外部系统通过 submit 提交评测，立即拿到一个编号，之后通过 poll 查询结果。
 * 提交会先进入评测队列，由固定数量的 worker 线程取出评测，每个 worker
 * 完整评测完一个提交之后才会取下一个，因此同时运行的选手程序不超过 worker 数量。
 */
namespace ojudge {

enum class submission_state {
    /**
     * @brief 提交在评测队列中等待，或者正在评测
     */
    PENDING,

    /**
     * @brief 评测完成，结果可以读取
     */
    DONE
};

const char *get_display_message(submission_state state);

struct submission_status {
    submission_state state;

    /**
     * @brief 评测结果，state 为 DONE 时才存在
     */
    std::optional<judge_result> result;
};

void to_json(nlohmann::json &j, const submission_status &status);

struct dispatcher {
    /**
     * @brief 启动评测 worker 线程
     * @param workers worker 线程数，即最多同时评测的提交数
     * @param exec 所有 worker 共享的执行器，必须可以被并发调用
     * @param store 题目测试数据的来源
     * @param loader 测试数据解析器
     */
    dispatcher(std::size_t workers, std::unique_ptr<runner> exec, std::unique_ptr<problem_store> store, test_case_loader loader = {});

    dispatcher(const dispatcher &) = delete;
    dispatcher &operator=(const dispatcher &) = delete;

    /**
     * @brief 停止并等待所有 worker 退出
     * 队列中剩余的提交会先评测完
     */
    ~dispatcher();

    /**
     * @brief 提交评测，不会阻塞
     * @return 提交编号，单调递增
     * @throw judge_exception 如果评测服务已经停止
     */
    unsigned submit(const std::string &problem_id, language lang, const std::string &source_code);

    /**
     * @brief 查询提交的评测状态
     * @throw judge_exception 如果提交编号不存在
     */
    submission_status poll(unsigned handle) const;

    /**
     * @brief 阻塞等待评测完成，最多等待 timeout
     * @return 评测结果，超时则返回空
     * @throw judge_exception 如果提交编号不存在
     */
    std::optional<judge_result> wait(unsigned handle, std::chrono::milliseconds timeout) const;

    /**
     * @brief 删除已经完成的提交的评测结果，之后这个编号不再可以查询
     * 调用方读取结果之后应当调用，否则结果会一直保存在内存中
     * @return 是否删除成功，提交还在评测时返回 false
     * @throw judge_exception 如果提交编号不存在
     */
    bool forget(unsigned handle);

    /**
     * @brief 标记停止，不再接受新提交
     * worker 在评测队列为空时自然退出
     */
    void stop();

private:
    struct task {
        unsigned handle = 0;
        submission submit;
    };

    void worker_loop(std::size_t worker_id);

    std::unique_ptr<runner> exec;
    std::unique_ptr<problem_store> store;
    test_case_loader loader;
    evaluator judger;

    concurrent_queue<task> tasks;
    std::atomic<bool> stopping{false};

    mutable std::mutex mut;
    mutable std::condition_variable finished;
    unsigned next_handle = 0;

    // 键为提交编号，值为空表示还在评测
    std::map<unsigned, std::optional<judge_result>> results;

    std::vector<std::thread> workers;
};

}  // namespace ojudge
