#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/io_utils.hpp"
#include "ojudge/common/utils.hpp"
#include "ojudge/config.hpp"
#include "ojudge/dispatcher.hpp"
#include "ojudge/runner.hpp"
using namespace std;

/**
 * @brief 运行一次选手程序并输出执行结果
 */
static int run_once(const ojudge::language_table &languages, const boost::program_options::variables_map &vm) {
    ojudge::execution_request request;
    request.lang = ojudge::parse_language(vm.at("language").as<string>());
    request.source_code = ojudge::read_file_content(vm.at("source").as<string>());
    if (vm.count("stdin"))
        request.stdin_payload = ojudge::read_file_content(vm.at("stdin").as<string>());
    if (vm.count("timeout"))
        request.timeout_override = chrono::milliseconds((long)(vm.at("timeout").as<double>() * 1000));

    ojudge::sandbox_runner runner(languages);
    nlohmann::json j;
    ojudge::to_json(j, runner.run(request));
    cout << j.dump(4) << endl;
    return EXIT_SUCCESS;
}

/**
 * @brief 通过评测队列评测一个提交并输出评测结果
 */
static int judge_once(const ojudge::language_table &languages, const boost::program_options::variables_map &vm, chrono::seconds wait_limit) {
    if (!vm.count("problem") || !vm.count("data")) {
        cerr << "--problem and --data are required to judge a submission" << endl;
        return EXIT_FAILURE;
    }

    ojudge::language lang = ojudge::parse_language(vm.at("language").as<string>());
    string source = ojudge::read_file_content(vm.at("source").as<string>());
    string problem = vm.at("problem").as<string>();

    filesystem::path data_dir = vm.at("data").as<string>();
    CHECK(filesystem::is_directory(data_dir))
        << "Test data directory " << data_dir << " does not exist";

    ojudge::dispatcher dispatcher(ojudge::WORKER_COUNT,
                                  make_unique<ojudge::sandbox_runner>(languages),
                                  make_unique<ojudge::directory_problem_store>(data_dir));
    unsigned handle = dispatcher.submit(problem, lang, source);
    auto result = dispatcher.wait(handle, wait_limit);
    dispatcher.stop();
    if (!result) {
        cerr << "Submission " << handle << " did not finish within " << wait_limit.count() << " seconds" << endl;
        return EXIT_FAILURE;
    }
    dispatcher.forget(handle);

    nlohmann::json j = *result;
    cout << j.dump(4) << endl;
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("ojudge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("problem", po::value<string>(), "set the problem id to judge against")
        ("language", po::value<string>(), "set the language of the source code: py, c, cpp, java, js")
        ("source", po::value<string>(), "set the path of the source code")
        ("data", po::value<string>(), "set the directory storing test data, containing problems/, inputs/ and outputs/")
        ("run", "run the source code once with --stdin instead of judging it")
        ("stdin", po::value<string>(), "set the file fed to the program in --run mode")
        ("timeout", po::value<double>(), "set the time limit in seconds of running the program in --run mode")
        ("config", po::value<string>(), "load configuration from given json file. You can either pass it from environ OJUDGE_CONFIG")
        ("workers", po::value<size_t>(), "set the number of submissions judged concurrently, default to 2. You can either pass it from environ OJUDGE_WORKERS")
        ("workspace-dir", po::value<string>(), "set the directory to create workspaces in, default to the system temporary directory. You can either pass it from environ OJUDGE_WORKSPACE_DIR")
        ("wait", po::value<unsigned>()->default_value(600), "set the maximum time in seconds to wait for the verdict")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "ojudge: Compile, run and judge a submission against the test data of a problem" << endl
             << "Usage: " << argv[0] << " --problem <id> --language <lang> --source <file> --data <dir> [options]" << endl
             << "       " << argv[0] << " --run --language <lang> --source <file> [--stdin <file>] [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "ojudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("language") || !vm.count("source")) {
        cerr << "--language and --source are required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    CHECK(filesystem::is_regular_file(vm.at("source").as<string>()))
        << "Source file " << vm.at("source").as<string>() << " does not exist";

    ojudge::language_table languages;

    try {
        // 优先级：命令行 > 环境变量 > 配置文件 > 默认值
        string config_file;
        if (vm.count("config")) {
            config_file = vm.at("config").as<string>();
        } else if (getenv("OJUDGE_CONFIG")) {
            config_file = getenv("OJUDGE_CONFIG");
        }
        if (!config_file.empty()) {
            CHECK(filesystem::is_regular_file(config_file))
                << "Configuration file " << config_file << " does not exist";
            ifstream fin(config_file);
            nlohmann::json config;
            try {
                fin >> config;
            } catch (nlohmann::json::exception& ex) {
                throw ojudge::judge_exception("malformed configuration file " + config_file + ": " + ex.what());
            }
            ojudge::load_config(config, languages);
        }

        if (vm.count("workspace-dir")) {
            ojudge::WORKSPACE_DIR = filesystem::path(vm.at("workspace-dir").as<string>());
        } else if (getenv("OJUDGE_WORKSPACE_DIR")) {
            ojudge::WORKSPACE_DIR = filesystem::path(getenv("OJUDGE_WORKSPACE_DIR"));
        }

        if (vm.count("workers")) {
            ojudge::WORKER_COUNT = vm.at("workers").as<size_t>();
        } else if (getenv("OJUDGE_WORKERS")) {
            ojudge::WORKER_COUNT = boost::lexical_cast<size_t>(getenv("OJUDGE_WORKERS"));
        }
        CHECK(ojudge::WORKER_COUNT > 0) << "At least one worker is required";

        if (vm.count("run"))
            return run_once(languages, vm);
        else
            return judge_once(languages, vm, chrono::seconds(vm.at("wait").as<unsigned>()));
    } catch (ojudge::judge_exception& ex) {
        LOG(ERROR) << ex;
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    } catch (boost::bad_lexical_cast& ex) {
        cerr << "Invalid OJUDGE_WORKERS: " << ex.what() << endl;
        return EXIT_FAILURE;
    }
}
