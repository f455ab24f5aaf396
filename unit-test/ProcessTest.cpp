#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <fmt/core.h>
#include <fstream>
#include <thread>
#include "gtest/gtest.h"
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/io_utils.hpp"
#include "ojudge/common/stl_utils.hpp"
#include "ojudge/config.hpp"
#include "ojudge/process.hpp"
#include "ojudge/workspace.hpp"

using namespace std;
using namespace std::chrono_literals;
using namespace ojudge;

/**
 * @brief 进程是否仍在运行，僵尸进程视为已经结束
 */
static bool process_alive(pid_t pid) {
    ifstream fin("/proc/" + to_string(pid) + "/stat");
    if (!fin) return false;
    string content((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());
    size_t pos = content.rfind(')');
    return pos != string::npos && pos + 2 < content.size() && content[pos + 2] != 'Z' && content[pos + 2] != 'X';
}

class ProcessTest : public ::testing::Test {
protected:
    unique_ptr<workspace> ws;

    void SetUp() override {
        ws = make_unique<workspace>(WORKSPACE_DIR);
    }

    void TearDown() override {
        ws.reset();
    }

    process_options shell(const string &script) {
        process_options opt;
        opt.argv = {"/bin/sh", "-c", script};
        opt.working_dir = ws->path();
        opt.stdout_file = ws->file("stdout");
        opt.stderr_file = ws->file("stderr");
        opt.timeout = 5s;
        opt.grace_period = 500ms;
        return opt;
    }
};

TEST_F(ProcessTest, SuccessTest) {
    auto result = run_process(shell("echo hello; echo world >&2"));
    EXPECT_TRUE(result.success());
    EXPECT_TRUE(result.exited);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(read_file_content(ws->file("stdout")), "hello\n");
    EXPECT_EQ(read_file_content(ws->file("stderr")), "world\n");
}

TEST_F(ProcessTest, ExitCodeTest) {
    auto result = run_process(shell("exit 3"));
    EXPECT_FALSE(result.success());
    EXPECT_TRUE(result.exited);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.timed_out);
}

TEST_F(ProcessTest, SignalTest) {
    auto result = run_process(shell("kill -SEGV $$"));
    EXPECT_FALSE(result.success());
    EXPECT_FALSE(result.exited);
    EXPECT_EQ(result.signal, SIGSEGV);
    EXPECT_EQ(result.exit_code, 128 + SIGSEGV);
}

TEST_F(ProcessTest, StdinTest) {
    write_file_content(ws->file("stdin"), "1 2\n");
    auto opt = shell("read a b; echo $((a + b))");
    opt.stdin_file = ws->file("stdin");
    auto result = run_process(opt);
    EXPECT_TRUE(result.success());
    EXPECT_EQ(read_file_content(ws->file("stdout")), "3\n");
}

TEST_F(ProcessTest, EmptyStdinTest) {
    // 没有指定 stdin 时读到 EOF 而不是阻塞
    auto result = run_process(shell("cat"));
    EXPECT_TRUE(result.success());
    EXPECT_EQ(read_file_content(ws->file("stdout")), "");
}

TEST_F(ProcessTest, WorkingDirectoryTest) {
    auto result = run_process(shell("pwd -P"));
    EXPECT_TRUE(result.success());
    EXPECT_EQ(trim(read_file_content(ws->file("stdout"))), filesystem::canonical(ws->path()).string());
}

TEST_F(ProcessTest, SpawnFailureTest) {
    process_options opt;
    opt.argv = {"/nonexistent/ojudge-program"};
    auto result = run_process(opt);
    EXPECT_TRUE(result.spawn_failed);
    EXPECT_FALSE(result.success());
    EXPECT_NE(result.spawn_error.find("/nonexistent/ojudge-program"), string::npos);
}

TEST_F(ProcessTest, EmptyCommandLineTest) {
    process_options opt;
    EXPECT_THROW(run_process(opt), process_error);
}

TEST_F(ProcessTest, TimeoutTest) {
    auto opt = shell("sleep 30");
    opt.timeout = 200ms;
    auto result = run_process(opt);
    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.success());
    EXPECT_LT(result.wall_time, 3s);
}

TEST_F(ProcessTest, TimeoutEscalationTest) {
    // 忽略 SIGTERM 的程序最终被 SIGKILL 杀死
    auto opt = shell("trap '' TERM; while true; do :; done");
    opt.timeout = 200ms;
    opt.grace_period = 300ms;
    auto result = run_process(opt);
    EXPECT_TRUE(result.timed_out);
    EXPECT_TRUE(result.force_killed);
    EXPECT_EQ(result.signal, SIGKILL);
    EXPECT_LT(result.wall_time, 3s);
}

TEST_F(ProcessTest, ProcessGroupCleanupTest) {
    // 后台子进程在父进程退出后也会被杀死
    auto result = run_process(shell("sleep 30 & echo $!"));
    EXPECT_TRUE(result.success());
    pid_t child = stoi(trim(read_file_content(ws->file("stdout"))));

    bool alive = true;
    for (int i = 0; i < 100 && alive; ++i) {
        alive = process_alive(child);
        if (alive) this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(alive);
}

TEST_F(ProcessTest, TimeoutKillsProcessGroupTest) {
    auto opt = shell("sleep 30 & echo $!; wait");
    opt.timeout = 300ms;
    auto result = run_process(opt);
    EXPECT_TRUE(result.timed_out);
    pid_t child = stoi(trim(read_file_content(ws->file("stdout"))));

    bool alive = true;
    for (int i = 0; i < 100 && alive; ++i) {
        alive = process_alive(child);
        if (alive) this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(alive);
}

TEST_F(ProcessTest, FileLimitTest) {
    auto opt = shell("head -c 1000000 /dev/zero");
    opt.file_limit = 1000;
    auto result = run_process(opt);
    EXPECT_FALSE(result.success());
    EXPECT_LE(filesystem::file_size(ws->file("stdout")), 1000);
}

TEST_F(ProcessTest, InheritedFileDescriptorTest) {
    // 模拟另一个 worker 正在写自己的工作目录，打开的文件没有 FD_CLOEXEC
    workspace other(WORKSPACE_DIR);
    int fd = open(other.file("stdin").c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    ASSERT_GE(fd, 0);
    ofstream fout(other.file("source").string());
    ASSERT_TRUE(fout);

    string script = fmt::format("if [ -e /proc/self/fd/{0} ]; then echo open; echo leaked >&{0}; else echo closed; fi", fd);
    auto result = run_process(shell(script));
    close(fd);
    fout.close();

    EXPECT_TRUE(result.success());
    EXPECT_EQ(read_file_content(ws->file("stdout")), "closed\n");
    EXPECT_EQ(read_file_content(other.file("stdin")), "");
}
