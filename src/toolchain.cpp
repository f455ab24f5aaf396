#include "ojudge/toolchain.hpp"
#include <glog/logging.h>
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/utils.hpp"
#include "ojudge/config.hpp"
#include "ojudge/process.hpp"

namespace ojudge {
using namespace std;

toolchain_resolver::toolchain_resolver(const language_table &languages)
    : languages(languages) {}

optional<string> toolchain_resolver::probe(const vector<string> &candidates, const vector<string> &probe_args) {
    for (auto &candidate : candidates) {
        process_options opt;
        opt.argv = make_argv(candidate, probe_args);
        opt.timeout = PROBE_TIMEOUT;
        opt.grace_period = KILL_GRACE_PERIOD;
        try {
            process_result result = run_process(opt);
            if (result.success())
                return candidate;
            if (result.spawn_failed)
                VLOG(1) << result.spawn_error;
            else if (result.timed_out)
                LOG(WARNING) << "Probing " << candidate << " timed out";
        } catch (process_error &ex) {
            LOG(WARNING) << "Unable to probe " << candidate << ": " << ex.what();
        }
    }
    return {};
}

optional<toolchain> toolchain_resolver::resolve(language lang) const {
    const language_settings &settings = languages.at(lang);
    toolchain result{lang, "", ""};

    if (settings.compiled) {
        auto compiler = probe(settings.compilers, settings.compiler_probe);
        if (!compiler) {
            LOG(ERROR) << "No usable compiler for " << get_display_name(lang);
            return {};
        }
        result.compiler = *compiler;
    }

    if (!settings.runtimes.empty()) {
        auto runtime = probe(settings.runtimes, settings.runtime_probe);
        if (!runtime) {
            LOG(ERROR) << "No usable interpreter for " << get_display_name(lang);
            return {};
        }
        result.runtime = *runtime;
    }

    LOG(INFO) << "Resolved toolchain for " << get_display_name(lang) << ": "
              << (result.compiler.empty() ? "" : "compiler " + result.compiler + " ")
              << (result.runtime.empty() ? "" : "runtime " + result.runtime);
    return result;
}

}  // namespace ojudge
