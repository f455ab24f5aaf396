#include "ojudge/judge/evaluator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <algorithm>
#include "ojudge/common/stl_utils.hpp"
#include "ojudge/config.hpp"

namespace ojudge {
using namespace std;

void to_json(nlohmann::json &j, const judge_result &result) {
    j = {{"verdict", get_short_code(result.result)},
         {"verdict_name", get_display_message(result.result)},
         {"message", result.message},
         {"cases_run", result.cases_run}};
    if (result.failed_case) {
        j["failed_case"] = *result.failed_case;
        j["failed_suite"] = result.failed_suite;
    }
}

static vector<string> normalized_lines(const string &text) {
    string unified = boost::algorithm::replace_all_copy(text, "\r\n", "\n");
    boost::algorithm::replace_all(unified, "\r", "\n");
    vector<string> lines;
    for (auto &line : split(unified, '\n'))
        lines.push_back(trim_right(line));
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();
    // 测试数据开头的空行在解析时被去掉，选手输出也同样处理
    auto first = find_if(lines.begin(), lines.end(), [](const string &line) { return !line.empty(); });
    lines.erase(lines.begin(), first);
    return lines;
}

string normalize_output(const string &text) {
    return boost::algorithm::join(normalized_lines(text), "\n");
}

/**
 * @brief 找到第一个不同的行号（从 1 开始），用于日志
 */
static size_t first_difference(const string &actual, const string &expected) {
    auto a = normalized_lines(actual), b = normalized_lines(expected);
    size_t i = 0;
    while (i < a.size() && i < b.size() && a[i] == b[i]) ++i;
    return i + 1;
}

/**
 * @brief 根据一个测试点的执行结果得到该测试点的评测结果
 * @param message 评测结果对应的错误信息
 */
static verdict classify(const execution_outcome &out, const test_case &tc, string &message) {
    return visit(overloaded{
                     [&](const outcome::success &r) {
                         if (normalize_output(r.stdout_text) == normalize_output(tc.expected_output))
                             return verdict::ACCEPTED;
                         size_t line = first_difference(r.stdout_text, tc.expected_output);
                         message = fmt::format("output differs from the expected output at line {}", line);
                         return verdict::WRONG_ANSWER;
                     },
                     [&](const outcome::compile_error &r) {
                         message = r.message;
                         return verdict::COMPILATION_ERROR;
                     },
                     [&](const outcome::runtime_error &r) {
                         message = fmt::format("exit code {}\n{}", r.exit_code, r.message);
                         return verdict::RUNTIME_ERROR;
                     },
                     [&](const outcome::timeout &r) {
                         message = r.phase == execution_phase::COMPILE ? "compile time limit exceeded" : "time limit exceeded";
                         return verdict::TIME_LIMIT_EXCEEDED;
                     },
                     [&](const outcome::toolchain_unavailable &r) {
                         message = fmt::format("no compiler or interpreter available for {}", get_display_name(r.lang));
                         return verdict::INTERNAL_ERROR;
                     },
                     [&](const outcome::internal_fault &r) {
                         message = r.message;
                         return verdict::INTERNAL_ERROR;
                     }},
                 out);
}

judge_result evaluator::judge(runner &exec, const submission &submit, const vector<test_suite> &suites) const {
    judge_result result;

    // 同一次评测的所有测试点共享编译结果，编译产物在评测结束时删除
    unique_ptr<build_cache> build;
    try {
        build = exec.open_build_cache();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Problem " << submit.problem_id << ": unable to prepare build: " << ex.what();
        result.result = verdict::INTERNAL_ERROR;
        result.message = ex.what();
        return result;
    }

    for (auto &suite : suites) {
        vector<test_case> cases = suite.cases;
        stable_sort(cases.begin(), cases.end(), [](const test_case &a, const test_case &b) {
            return a.ordinal < b.ordinal;
        });

        for (auto &tc : cases) {
            execution_request request{submit.lang, submit.source_code, tc.input, suite.timeout, build.get()};
            if (!request.stdin_payload.empty()) request.stdin_payload += '\n';

            ++result.cases_run;
            verdict v;
            string message;
            try {
                execution_outcome out = exec.run(request);
                v = classify(out, tc, message);
            } catch (std::exception &ex) {
                v = verdict::INTERNAL_ERROR;
                message = ex.what();
            }

            if (v == verdict::ACCEPTED) {
                LOG(INFO) << "Problem " << submit.problem_id << ": " << suite.name << " case " << tc.ordinal << " passed";
                continue;
            }

            result.result = v;
            result.message = message;
            result.failed_case = tc.ordinal;
            result.failed_suite = suite.name;
            if (v == verdict::INTERNAL_ERROR)
                LOG(ERROR) << "Problem " << submit.problem_id << ": internal error on " << suite.name << " case " << tc.ordinal << ": " << message;
            else
                LOG(WARNING) << "Problem " << submit.problem_id << ": " << get_display_message(v) << " on " << suite.name
                             << " case " << tc.ordinal << (v == verdict::WRONG_ANSWER ? ", " + message : "");
            return result;
        }
    }

    return result;
}

judge_result evaluator::judge(runner &exec, const test_case_loader &loader, const problem_store &store, const submission &submit) const {
    vector<test_suite> suites;
    try {
        if (auto visible = store.visible_corpus(submit.problem_id))
            suites.push_back({"visible", loader.parse(visible->inputs, visible->outputs), {}});

        if (auto hidden = store.hidden_corpus(submit.problem_id)) {
            optional<chrono::milliseconds> timeout;
            if (HIDDEN_RUN_TIMEOUT.count() > 0) timeout = HIDDEN_RUN_TIMEOUT;
            suites.push_back({"hidden", loader.parse(hidden->inputs, hidden->outputs), timeout});
        }
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to load test data of problem " << submit.problem_id << ": " << ex.what();
        judge_result result;
        result.result = verdict::INTERNAL_ERROR;
        result.message = ex.what();
        return result;
    }

    if (suites.empty()) {
        LOG(ERROR) << "Problem " << submit.problem_id << " has no test data";
        judge_result result;
        result.result = verdict::INTERNAL_ERROR;
        result.message = "no test data";
        return result;
    }

    return judge(exec, submit, suites);
}

}  // namespace ojudge
