#include "gtest/gtest.h"
#include "ojudge/toolchain.hpp"

using namespace std;
using namespace ojudge;

TEST(ToolchainTest, ProbeFirstAvailableTest) {
    auto found = toolchain_resolver::probe({"/nonexistent/sh", "/bin/sh", "sh"}, {"-c", "exit 0"});
    ASSERT_TRUE(found);
    EXPECT_EQ(*found, "/bin/sh");
}

TEST(ToolchainTest, ProbeFailingCandidateTest) {
    // 探测以非零返回码退出的候选程序视为不可用
    auto found = toolchain_resolver::probe({"/bin/sh"}, {"-c", "exit 1"});
    EXPECT_FALSE(found);
}

TEST(ToolchainTest, ProbeNothingTest) {
    EXPECT_FALSE(toolchain_resolver::probe({}, {"--version"}));
    EXPECT_FALSE(toolchain_resolver::probe({"/nonexistent/a", "ojudge-nonexistent-b"}, {"--version"}));
}

TEST(ToolchainTest, UnavailableLanguageTest) {
    language_table table;
    table.at(language::CPP).compilers = {"/nonexistent/g++"};
    toolchain_resolver resolver(table);
    EXPECT_FALSE(resolver.resolve(language::CPP));
}

TEST(ToolchainTest, ResolveInterpreterTest) {
    language_table table;
    table.at(language::PYTHON).runtimes = {"/nonexistent/python3", "/bin/sh"};
    table.at(language::PYTHON).runtime_probe = {"-c", "exit 0"};
    toolchain_resolver resolver(table);
    auto tc = resolver.resolve(language::PYTHON);
    ASSERT_TRUE(tc);
    EXPECT_EQ(tc->runtime, "/bin/sh");
    EXPECT_TRUE(tc->compiler.empty());
}
