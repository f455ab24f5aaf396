#include "ojudge/runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <string.h>
#include <csignal>
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/io_utils.hpp"
#include "ojudge/common/utils.hpp"
#include "ojudge/config.hpp"
#include "ojudge/process.hpp"

namespace ojudge {
using namespace std;
namespace fs = std::filesystem;

/**
 * @brief sandbox_runner 的编译结果
 * 编译目录中保存源文件和编译产物，随缓存一起删除
 */
struct sandbox_build : public build_cache {
    bool prepared = false;
    language lang = language::PYTHON;
    string source_code;

    optional<toolchain> tc;
    unique_ptr<workspace> ws;
    fs::path source, artifact;

    /**
     * @brief 编译失败或者工具链不可用时的执行结果，之后的测试点直接返回它
     */
    optional<execution_outcome> failure;
};

sandbox_runner::sandbox_runner(const language_table &languages)
    : languages(languages), resolver(languages) {}

unique_ptr<build_cache> sandbox_runner::open_build_cache() {
    return make_unique<sandbox_build>();
}

/**
 * @brief 构造编译命令
 * C、C++ 直接生成可执行文件；Java 生成 class 文件到工作目录
 */
static vector<string> compile_command(language lang, const toolchain &tc, const language_settings &settings, const workspace &ws, const fs::path &source, const fs::path &artifact) {
    switch (lang) {
        case language::C:
        case language::CPP:
            // -lm 之类的链接参数必须在源文件之后
            return make_argv(tc.compiler, source, "-o", artifact, settings.compile_flags);
        case language::JAVA:
            return make_argv(tc.compiler, settings.compile_flags, "-d", ws.path(), source);
        case language::PYTHON:
        case language::JAVASCRIPT:
            break;
    }
    throw internal_error(fmt::format("{} does not have a compile step", get_display_name(lang)));
}

/**
 * @brief 构造运行命令
 */
static vector<string> run_command(language lang, const toolchain &tc, const language_settings &settings, const workspace &ws, const fs::path &source, const fs::path &artifact) {
    switch (lang) {
        case language::C:
        case language::CPP:
            return make_argv(artifact, settings.run_flags);
        case language::JAVA:
            // 主类名即为源文件名
            return make_argv(tc.runtime, settings.run_flags, "-cp", ws.path(), source.stem());
        case language::PYTHON:
        case language::JAVASCRIPT:
            return make_argv(tc.runtime, settings.run_flags, source);
    }
    throw internal_error(fmt::format("unrecognized language {}", (int)lang));
}

execution_outcome sandbox_runner::run(const execution_request &request) {
    try {
        // 没有共享的编译结果时单独编译，编译目录在返回前删除
        sandbox_build local;
        sandbox_build *build = &local;
        if (request.build) {
            build = dynamic_cast<sandbox_build *>(request.build);
            if (!build)
                throw internal_error("build cache was not created by sandbox_runner");
        }

        if (auto failure = prepare(*build, request)) return *failure;

        workspace ws(WORKSPACE_DIR);
        execution_outcome result = run_in(ws, *build, request);
        // 删除失败只记录日志，不影响执行结果
        ws.release();
        return result;
    } catch (judge_exception &ex) {
        LOG(ERROR) << "Internal fault while running " << get_display_name(request.lang) << " program: " << ex;
        return outcome::internal_fault{ex.what()};
    } catch (std::exception &ex) {
        LOG(ERROR) << "Internal fault while running " << get_display_name(request.lang) << " program: " << ex.what();
        return outcome::internal_fault{ex.what()};
    }
}

optional<execution_outcome> sandbox_runner::prepare(sandbox_build &build, const execution_request &request) {
    if (build.prepared) {
        if (build.lang != request.lang || build.source_code != request.source_code)
            throw internal_error("build cache is shared by different programs");
        return build.failure;
    }

    optional<toolchain> tc = resolver.resolve(request.lang);
    if (!tc) {
        build.failure = outcome::toolchain_unavailable{request.lang};
    } else {
        const language_settings &settings = languages.at(tc->lang);
        auto ws = make_unique<workspace>(WORKSPACE_DIR);
        string stem = settings.source_name.empty() ? ws->id() : settings.source_name;
        build.source = ws->file(stem + settings.extension);
        build.artifact = ws->file(stem);
        write_file_content(build.source, request.source_code);

        if (settings.compiled)
            build.failure = compile(*ws, *tc, build.source, build.artifact);
        build.ws = move(ws);
        build.tc = tc;
    }

    build.lang = request.lang;
    build.source_code = request.source_code;
    build.prepared = true;
    return build.failure;
}

optional<execution_outcome> sandbox_runner::compile(const workspace &ws, const toolchain &tc, const fs::path &source, const fs::path &artifact) {
    const language_settings &settings = languages.at(tc.lang);

    process_options opt;
    opt.argv = compile_command(tc.lang, tc, settings, ws, source, artifact);
    opt.working_dir = ws.path();
    opt.stdout_file = ws.file("compile.out");
    opt.stderr_file = ws.file("compile.err");
    opt.timeout = settings.compile_timeout;
    opt.grace_period = KILL_GRACE_PERIOD;
    opt.file_limit = OUTPUT_LIMIT;

    process_result result = run_process(opt);
    if (result.spawn_failed)
        return outcome::internal_fault{"unable to start compiler " + tc.compiler + ": " + result.spawn_error};
    if (result.timed_out) {
        LOG(WARNING) << "Compilation in " << ws.path() << " exceeded " << settings.compile_timeout.count() << "ms";
        return outcome::timeout{execution_phase::COMPILE};
    }
    if (!result.success()) {
        string message = read_file_content(opt.stderr_file, "");
        if (message.empty()) message = read_file_content(opt.stdout_file, "");
        LOG(WARNING) << "Compilation in " << ws.path() << " failed with exit code " << result.exit_code;
        return outcome::compile_error{utf8_sanitize(message)};
    }
    return {};
}

execution_outcome sandbox_runner::run_in(const workspace &ws, const sandbox_build &build, const execution_request &request) {
    const toolchain &tc = *build.tc;
    const language_settings &settings = languages.at(tc.lang);

    process_options opt;
    opt.argv = run_command(tc.lang, tc, settings, *build.ws, build.source, build.artifact);
    opt.working_dir = ws.path();
    opt.stdin_file = ws.file("stdin");
    opt.stdout_file = ws.file("stdout");
    opt.stderr_file = ws.file("stderr");
    opt.timeout = request.timeout_override.value_or(settings.run_timeout);
    opt.grace_period = KILL_GRACE_PERIOD;
    opt.file_limit = OUTPUT_LIMIT;
    opt.proc_limit = PROC_LIMIT;
    write_file_content(opt.stdin_file, request.stdin_payload);

    process_result result = run_process(opt);
    if (result.spawn_failed)
        return outcome::internal_fault{"unable to start " + opt.argv[0] + ": " + result.spawn_error};
    if (result.timed_out) {
        LOG(WARNING) << "Program in " << ws.path() << " exceeded time limit of " << opt.timeout.count() << "ms"
                     << (result.force_killed ? ", killed by SIGKILL" : "");
        return outcome::timeout{execution_phase::RUN};
    }
    if (!result.success()) {
        string message = utf8_sanitize(read_file_content(opt.stderr_file, ""));
        if (result.signal == SIGXFSZ)
            message += fmt::format("\noutput limit of {} bytes exceeded", OUTPUT_LIMIT);
        else if (result.signal > 0 && message.empty())
            message = fmt::format("killed by signal {} ({})", result.signal, strsignal(result.signal));
        LOG(WARNING) << "Program in " << ws.path() << " exited with code " << result.exit_code;
        return outcome::runtime_error{message, result.exit_code};
    }

    return outcome::success{utf8_sanitize(read_file_content(opt.stdout_file, ""))};
}

}  // namespace ojudge
