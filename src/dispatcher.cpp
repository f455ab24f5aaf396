#include "ojudge/dispatcher.hpp"
#include <glog/logging.h>
#include "ojudge/common/exceptions.hpp"

namespace ojudge {
using namespace std;

// worker 在队列为空时检查停止标记的间隔
static constexpr chrono::milliseconds POLL_INTERVAL(100);

const char *get_display_message(submission_state state) {
    switch (state) {
        case submission_state::PENDING: return "pending";
        case submission_state::DONE: return "done";
    }
    return "unknown";
}

void to_json(nlohmann::json &j, const submission_status &status) {
    j = {{"status", get_display_message(status.state)}};
    if (status.result) j["result"] = *status.result;
}

dispatcher::dispatcher(size_t workers, unique_ptr<runner> exec, unique_ptr<problem_store> store, test_case_loader loader)
    : exec(move(exec)), store(move(store)), loader(loader) {
    if (workers == 0)
        throw judge_exception("dispatcher requires at least one worker");
    for (size_t i = 0; i < workers; ++i)
        this->workers.emplace_back([this, i] { worker_loop(i); });
}

dispatcher::~dispatcher() {
    stop();
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
}

unsigned dispatcher::submit(const string &problem_id, language lang, const string &source_code) {
    unsigned handle;
    {
        // 与 stop 互斥，保证 stop 之前接受的提交都已经进入队列
        scoped_lock guard(mut);
        if (stopping)
            throw judge_exception("dispatcher has been stopped");
        handle = ++next_handle;
        results[handle] = nullopt;
        tasks.push({handle, {problem_id, lang, source_code}});
    }
    LOG(INFO) << "Accepted submission " << handle << " for problem " << problem_id << " in " << get_display_name(lang);
    return handle;
}

submission_status dispatcher::poll(unsigned handle) const {
    scoped_lock guard(mut);
    auto it = results.find(handle);
    if (it == results.end())
        throw judge_exception("unknown submission ") << handle;
    if (!it->second) return {submission_state::PENDING, nullopt};
    return {submission_state::DONE, it->second};
}

optional<judge_result> dispatcher::wait(unsigned handle, chrono::milliseconds timeout) const {
    unique_lock lock(mut);
    if (!results.count(handle))
        throw judge_exception("unknown submission ") << handle;
    finished.wait_for(lock, timeout, [&] { return results.at(handle).has_value(); });
    return results.at(handle);
}

bool dispatcher::forget(unsigned handle) {
    scoped_lock guard(mut);
    auto it = results.find(handle);
    if (it == results.end())
        throw judge_exception("unknown submission ") << handle;
    if (!it->second) return false;
    results.erase(it);
    return true;
}

void dispatcher::stop() {
    bool was_stopping;
    {
        scoped_lock guard(mut);
        was_stopping = stopping.exchange(true);
    }
    if (!was_stopping)
        LOG(INFO) << "Stopping " << workers.size() << " worker(s)";
}

void dispatcher::worker_loop(size_t worker_id) {
    LOG(INFO) << "Worker " << worker_id << " started";

    while (true) {
        task current;
        if (!tasks.try_pop_for(current, POLL_INTERVAL)) {
            if (!stopping) continue;
            // 停止后不再有新提交，但等待期间可能有提交在 stop 之前进入队列，
            // 再检查一次队列，确实为空时 worker 才退出
            if (!tasks.try_pop_for(current, chrono::milliseconds(0))) break;
        }

        judge_result result;
        try {
            result = judger.judge(*exec, loader, *store, current.submit);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when judging submission " << current.handle << ", " << ex.what();
            result.result = verdict::INTERNAL_ERROR;
            result.message = ex.what();
        }

        {
            scoped_lock guard(mut);
            results[current.handle] = result;
        }
        finished.notify_all();
        LOG(INFO) << "Submission " << current.handle << " finished: " << result.result;
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace ojudge
