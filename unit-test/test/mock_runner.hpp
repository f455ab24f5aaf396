#pragma once

#include <memory>
#include "gmock/gmock.h"
#include "ojudge/runner.hpp"

namespace ojudge::mock {

/**
 * @brief 测试用的执行器，不会真正运行程序
 * 用法：
 * 1. mock_runner exec;
 * 2. EXPECT_CALL(exec, run(_)).WillOnce(Return(execution_outcome{outcome::success{"5\n"}}));
 * 3. evaluator().judge(exec, submit, suites);
 */
struct mock_runner : public runner {
    MOCK_METHOD(execution_outcome, run, (const execution_request &request), (override));
};

/**
 * @brief 支持编译结果缓存的 mock 执行器，用于检查评测器如何共享编译结果
 */
struct mock_caching_runner : public mock_runner {
    MOCK_METHOD(std::unique_ptr<build_cache>, open_build_cache, (), (override));
};

/**
 * @brief 把 stdin 原样输出的执行器，模拟 echo 程序
 */
struct echo_runner : public runner {
    execution_outcome run(const execution_request &request) override {
        return outcome::success{request.stdin_payload};
    }
};

}  // namespace ojudge::mock
