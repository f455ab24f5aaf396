#include "ojudge/config.hpp"
#include "ojudge/common/exceptions.hpp"

namespace ojudge {
using namespace std;
using namespace std::chrono_literals;

filesystem::path WORKSPACE_DIR = filesystem::temp_directory_path();
chrono::milliseconds PROBE_TIMEOUT = 5s;
chrono::milliseconds KILL_GRACE_PERIOD = 5s;
chrono::milliseconds HIDDEN_RUN_TIMEOUT = 0s;
long OUTPUT_LIMIT = 64L << 20;  // 64M
int PROC_LIMIT = -1;
size_t WORKER_COUNT = 2;

static chrono::milliseconds seconds_from_json(const nlohmann::json &j) {
    return chrono::milliseconds(static_cast<long long>(j.get<double>() * 1000));
}

void load_config(const nlohmann::json &j, language_table &languages) {
    try {
        if (j.count("workspace_dir")) WORKSPACE_DIR = j.at("workspace_dir").get<string>();
        if (j.count("workers")) WORKER_COUNT = j.at("workers").get<size_t>();
        if (j.count("probe_timeout")) PROBE_TIMEOUT = seconds_from_json(j.at("probe_timeout"));
        if (j.count("kill_grace_period")) KILL_GRACE_PERIOD = seconds_from_json(j.at("kill_grace_period"));
        if (j.count("hidden_run_timeout")) HIDDEN_RUN_TIMEOUT = seconds_from_json(j.at("hidden_run_timeout"));
        if (j.count("output_limit")) OUTPUT_LIMIT = j.at("output_limit").get<long>();
        if (j.count("proc_limit")) PROC_LIMIT = j.at("proc_limit").get<int>();
        if (j.count("languages")) from_json(j.at("languages"), languages);
    } catch (nlohmann::json::exception &ex) {
        throw judge_exception(string("Malformed configuration: ") + ex.what());
    }
}

}  // namespace ojudge
