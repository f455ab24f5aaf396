#include "gtest/gtest.h"
#include "ojudge/common/io_utils.hpp"
#include "ojudge/common/utils.hpp"
#include "ojudge/config.hpp"
#include "ojudge/judge/evaluator.hpp"
#include "ojudge/runner.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace std::chrono_literals;
using namespace ojudge;

#define REQUIRE_TOOLCHAIN(lang)                                   \
    if (!has_toolchain(lang)) {                                   \
        GTEST_SKIP() << get_display_name(lang) << " is not installed"; \
    }

class SandboxRunnerTest : public ::testing::Test {
protected:
    language_table languages;

    execution_outcome run(language lang, const string &source, const string &stdin_payload = "", optional<chrono::milliseconds> timeout = {}) {
        sandbox_runner runner(languages);
        return runner.run({lang, source, stdin_payload, timeout});
    }
};

TEST_F(SandboxRunnerTest, PythonEchoTest) {
    REQUIRE_TOOLCHAIN(language::PYTHON);
    auto result = run(language::PYTHON, "print(input())", "5\n");
    ASSERT_TRUE(holds_alternative<outcome::success>(result)) << describe(result);
    EXPECT_EQ(get<outcome::success>(result).stdout_text, "5\n");
    EXPECT_EQ(count_workspaces(), 0);
}

TEST_F(SandboxRunnerTest, PythonRuntimeErrorTest) {
    REQUIRE_TOOLCHAIN(language::PYTHON);
    auto result = run(language::PYTHON, "import sys\nsys.stderr.write('boom')\nsys.exit(3)");
    ASSERT_TRUE(holds_alternative<outcome::runtime_error>(result)) << describe(result);
    EXPECT_EQ(get<outcome::runtime_error>(result).exit_code, 3);
    EXPECT_EQ(get<outcome::runtime_error>(result).message, "boom");
    EXPECT_EQ(count_workspaces(), 0);
}

TEST_F(SandboxRunnerTest, PythonTimeoutTest) {
    REQUIRE_TOOLCHAIN(language::PYTHON);
    elapsed_time timer;
    auto result = run(language::PYTHON, "while True:\n    pass\n", "", 2s);
    ASSERT_TRUE(holds_alternative<outcome::timeout>(result)) << describe(result);
    EXPECT_EQ(get<outcome::timeout>(result).phase, execution_phase::RUN);
    EXPECT_LT(timer.duration<chrono::milliseconds>(), 2s + KILL_GRACE_PERIOD + 2s);
    EXPECT_EQ(count_workspaces(), 0);
}

TEST_F(SandboxRunnerTest, PythonInvalidUtf8Test) {
    REQUIRE_TOOLCHAIN(language::PYTHON);
    auto result = run(language::PYTHON, "import sys\nsys.stdout.buffer.write(b'a\\xffb')");
    ASSERT_TRUE(holds_alternative<outcome::success>(result)) << describe(result);
    EXPECT_EQ(get<outcome::success>(result).stdout_text, "a\xef\xbf\xbd" "b");
}

TEST_F(SandboxRunnerTest, DeterminismTest) {
    REQUIRE_TOOLCHAIN(language::PYTHON);
    string source = "n = int(input())\nprint(sum(range(n)))";
    auto first = run(language::PYTHON, source, "1000\n");
    auto second = run(language::PYTHON, source, "1000\n");
    ASSERT_TRUE(holds_alternative<outcome::success>(first)) << describe(first);
    ASSERT_TRUE(holds_alternative<outcome::success>(second)) << describe(second);
    EXPECT_EQ(get<outcome::success>(first).stdout_text, get<outcome::success>(second).stdout_text);
    EXPECT_EQ(get<outcome::success>(first).stdout_text, "499500\n");
}

TEST_F(SandboxRunnerTest, CppAcceptedTest) {
    REQUIRE_TOOLCHAIN(language::CPP);
    auto result = run(language::CPP, R"(
#include <iostream>
int main() {
    int a, b;
    std::cin >> a >> b;
    std::cout << a + b << std::endl;
})",
                      "1 2\n");
    ASSERT_TRUE(holds_alternative<outcome::success>(result)) << describe(result);
    EXPECT_EQ(get<outcome::success>(result).stdout_text, "3\n");
    EXPECT_EQ(count_workspaces(), 0);
}

TEST_F(SandboxRunnerTest, CCompileErrorTest) {
    REQUIRE_TOOLCHAIN(language::C);
    auto result = run(language::C, "int main() { return 0 }");
    ASSERT_TRUE(holds_alternative<outcome::compile_error>(result)) << describe(result);
    EXPECT_NE(get<outcome::compile_error>(result).message.find("error"), string::npos);
    EXPECT_EQ(count_workspaces(), 0);
}

TEST_F(SandboxRunnerTest, CMathLibraryTest) {
    REQUIRE_TOOLCHAIN(language::C);
    auto result = run(language::C, R"(
#include <math.h>
#include <stdio.h>
int main() {
    double x;
    scanf("%lf", &x);
    printf("%.0f\n", sqrt(x));
    return 0;
})",
                      "16\n");
    ASSERT_TRUE(holds_alternative<outcome::success>(result)) << describe(result);
    EXPECT_EQ(get<outcome::success>(result).stdout_text, "4\n");
}

TEST_F(SandboxRunnerTest, CppSegmentationFaultTest) {
    REQUIRE_TOOLCHAIN(language::CPP);
    auto result = run(language::CPP, "int main() { volatile int *p = nullptr; *p = 1; }");
    ASSERT_TRUE(holds_alternative<outcome::runtime_error>(result)) << describe(result);
    EXPECT_NE(get<outcome::runtime_error>(result).exit_code, 0);
}

TEST_F(SandboxRunnerTest, CppForkedChildTimeoutTest) {
    REQUIRE_TOOLCHAIN(language::CPP);
    // 父进程退出后，fork 出来的子进程不会继续运行
    auto result = run(language::CPP, R"(
#include <unistd.h>
int main() {
    if (fork() == 0) while (true) {}
    while (true) {}
})",
                      "", 1s);
    ASSERT_TRUE(holds_alternative<outcome::timeout>(result)) << describe(result);
    EXPECT_EQ(count_workspaces(), 0);
}

TEST_F(SandboxRunnerTest, JavaAcceptedTest) {
    REQUIRE_TOOLCHAIN(language::JAVA);
    auto result = run(language::JAVA, R"(
public class Main {
    public static void main(String[] args) {
        System.out.println("hello world");
    }
})");
    ASSERT_TRUE(holds_alternative<outcome::success>(result)) << describe(result);
    EXPECT_EQ(get<outcome::success>(result).stdout_text, "hello world\n");
}

TEST_F(SandboxRunnerTest, JavaScriptAcceptedTest) {
    REQUIRE_TOOLCHAIN(language::JAVASCRIPT);
    auto result = run(language::JAVASCRIPT, "console.log('hello world')");
    ASSERT_TRUE(holds_alternative<outcome::success>(result)) << describe(result);
    EXPECT_EQ(get<outcome::success>(result).stdout_text, "hello world\n");
}

TEST_F(SandboxRunnerTest, ToolchainUnavailableTest) {
    languages.at(language::CPP).compilers = {"/nonexistent/g++"};
    auto result = run(language::CPP, "int main() {}");
    ASSERT_TRUE(holds_alternative<outcome::toolchain_unavailable>(result)) << describe(result);
    EXPECT_EQ(get<outcome::toolchain_unavailable>(result).lang, language::CPP);
}

TEST_F(SandboxRunnerTest, WorkspaceFaultTest) {
    REQUIRE_TOOLCHAIN(language::PYTHON);
    auto workspace_dir = WORKSPACE_DIR;
    WORKSPACE_DIR = "/proc/ojudge-cannot-create-here";
    auto result = run(language::PYTHON, "print(1)");
    WORKSPACE_DIR = workspace_dir;
    EXPECT_TRUE(holds_alternative<outcome::internal_fault>(result)) << describe(result);
}

class SandboxJudgeTest : public SandboxRunnerTest {
protected:
    evaluator judger;
    test_case_loader loader;
};

TEST_F(SandboxJudgeTest, ScenarioAcceptedTest) {
    REQUIRE_TOOLCHAIN(language::PYTHON);
    sandbox_runner runner(languages);
    test_suite suite{"visible", loader.parse("5\n7\n", "5\n7\n"), {}};
    auto result = judger.judge(runner, {"echo", language::PYTHON, "print(input())"}, {suite});
    EXPECT_EQ(result.result, verdict::ACCEPTED) << result.message;
    EXPECT_EQ(result.cases_run, 2);
}

TEST_F(SandboxJudgeTest, ScenarioWrongAnswerTest) {
    REQUIRE_TOOLCHAIN(language::PYTHON);
    sandbox_runner runner(languages);
    test_suite suite{"visible", loader.parse("5\n", "6\n"), {}};
    auto result = judger.judge(runner, {"echo", language::PYTHON, "print(input())"}, {suite});
    EXPECT_EQ(result.result, verdict::WRONG_ANSWER);
    EXPECT_EQ(result.cases_run, 1);
}

TEST_F(SandboxJudgeTest, ScenarioCompileErrorTest) {
    REQUIRE_TOOLCHAIN(language::C);
    sandbox_runner runner(languages);
    test_suite suite{"visible", loader.parse("1\n2\n", "1\n2\n"), {}};
    auto result = judger.judge(runner, {"syntax", language::C, "int main( { }"}, {suite});
    EXPECT_EQ(result.result, verdict::COMPILATION_ERROR);
    EXPECT_EQ(result.cases_run, 1);
}

TEST_F(SandboxJudgeTest, ScenarioTimeLimitExceededTest) {
    REQUIRE_TOOLCHAIN(language::PYTHON);
    sandbox_runner runner(languages);
    test_suite suite{"visible", loader.parse("1\n2\n", "1\n2\n"), 2s};
    elapsed_time timer;
    auto result = judger.judge(runner, {"loop", language::PYTHON, "while True: pass"}, {suite});
    EXPECT_EQ(result.result, verdict::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(result.cases_run, 1);
    EXPECT_LT(timer.duration<chrono::milliseconds>(), 2s + KILL_GRACE_PERIOD + 2s);
}

TEST_F(SandboxJudgeTest, CompileOncePerJudgeTest) {
    // 用 shell 脚本代替 C 编译器，记录编译次数。编译产物是一个 echo 程序
    filesystem::path tools = WORKSPACE_DIR / "fake-cc";
    filesystem::create_directories(tools);
    filesystem::path counter = tools / "count", compiler = tools / "cc";
    write_file_content(compiler, "#!/bin/sh\n"
                                 "if [ \"$1\" = --version ]; then exit 0; fi\n"
                                 "echo compiled >> '" + counter.string() + "'\n"
                                 "printf '#!/bin/sh\\nread line\\necho \"$line\"\\n' > \"$3\"\n"
                                 "chmod +x \"$3\"\n");
    filesystem::permissions(compiler, filesystem::perms::owner_all);

    languages.at(language::C).compilers = {compiler.string()};
    languages.at(language::C).compile_flags = {};
    sandbox_runner runner(languages);

    test_suite visible{"visible", loader.parse("1\n2\n3", "1\n2\n3"), {}};
    test_suite hidden{"hidden", loader.parse("4\n5", "4\n5"), {}};
    auto result = judger.judge(runner, {"echo", language::C, "int main() {}"}, {visible, hidden});
    EXPECT_EQ(result.result, verdict::ACCEPTED) << result.message;
    EXPECT_EQ(result.cases_run, 5);
    EXPECT_EQ(read_file_content(counter), "compiled\n");
    EXPECT_EQ(count_workspaces(), 0);

    filesystem::remove_all(tools);
}

TEST_F(SandboxJudgeTest, CompileErrorCachedTest) {
    REQUIRE_TOOLCHAIN(language::C);
    sandbox_runner runner(languages);
    auto build = runner.open_build_cache();
    execution_request request{language::C, "int main( { }", "", {}, build.get()};
    auto first = runner.run(request);
    auto second = runner.run(request);
    ASSERT_TRUE(holds_alternative<outcome::compile_error>(first)) << describe(first);
    ASSERT_TRUE(holds_alternative<outcome::compile_error>(second)) << describe(second);
    EXPECT_EQ(get<outcome::compile_error>(first).message, get<outcome::compile_error>(second).message);

    // 同一个缓存不能用于另一份源代码
    request.source_code = "int main() { return 0; }";
    EXPECT_TRUE(holds_alternative<outcome::internal_fault>(runner.run(request)));

    build.reset();
    EXPECT_EQ(count_workspaces(), 0);
}
