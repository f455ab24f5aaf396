#include "ojudge/language.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/assign.hpp>
#include <unordered_map>
#include "ojudge/common/exceptions.hpp"

namespace ojudge {
using namespace std;

const vector<language> &all_languages() {
    static const vector<language> languages = {
        language::PYTHON, language::C, language::CPP, language::JAVA, language::JAVASCRIPT};
    return languages;
}

// clang-format off
static const unordered_map<string, language> language_tags = boost::assign::map_list_of
    ("py", language::PYTHON)
    ("python", language::PYTHON)
    ("python3", language::PYTHON)
    ("c", language::C)
    ("cpp", language::CPP)
    ("c++", language::CPP)
    ("java", language::JAVA)
    ("js", language::JAVASCRIPT)
    ("javascript", language::JAVASCRIPT);
// clang-format on

language parse_language(const string &tag) {
    auto it = language_tags.find(boost::algorithm::to_lower_copy(tag));
    if (it == language_tags.end())
        throw judge_exception("Unrecognized language " + tag);
    return it->second;
}

const char *get_language_tag(language lang) {
    switch (lang) {
        case language::PYTHON: return "py";
        case language::C: return "c";
        case language::CPP: return "cpp";
        case language::JAVA: return "java";
        case language::JAVASCRIPT: return "js";
    }
    throw judge_exception("Unknown language");
}

const char *get_display_name(language lang) {
    switch (lang) {
        case language::PYTHON: return "Python 3";
        case language::C: return "C";
        case language::CPP: return "C++";
        case language::JAVA: return "Java";
        case language::JAVASCRIPT: return "JavaScript";
    }
    throw judge_exception("Unknown language");
}

std::ostream &operator<<(std::ostream &os, language lang) {
    return os << get_language_tag(lang);
}

language_settings default_language_settings(language lang) {
    using namespace std::chrono_literals;
    language_settings s;
    switch (lang) {
        case language::PYTHON:
            s.extension = ".py";
            s.runtimes = {"/usr/local/bin/python3", "/usr/bin/python3", "python3", "python"};
            s.run_timeout = 10s;
            break;
        case language::C:
            s.extension = ".c";
            s.compiled = true;
            s.compilers = {"/usr/bin/gcc", "gcc"};
            s.compile_flags = {"-std=c99", "-O2", "-Wall", "-lm"};
            s.compile_timeout = 15s;
            s.run_timeout = 10s;
            break;
        case language::CPP:
            s.extension = ".cpp";
            s.compiled = true;
            s.compilers = {"/usr/bin/g++", "g++"};
            s.compile_flags = {"-std=c++17", "-O2", "-Wall"};
            s.compile_timeout = 15s;
            s.run_timeout = 10s;
            break;
        case language::JAVA:
            s.extension = ".java";
            s.source_name = "Main";
            s.compiled = true;
            s.compilers = {"/usr/bin/javac", "javac"};
            s.compiler_probe = {"-version"};
            s.runtimes = {"/usr/bin/java", "java"};
            s.runtime_probe = {"-version"};
            s.compile_flags = {"-encoding", "UTF-8"};
            s.compile_timeout = 20s;
            s.run_timeout = 15s;
            break;
        case language::JAVASCRIPT:
            s.extension = ".js";
            s.runtimes = {"/usr/local/bin/node", "/usr/bin/node", "node", "nodejs"};
            s.run_timeout = 10s;
            break;
    }
    return s;
}

language_table::language_table() {
    for (language lang : all_languages())
        settings.emplace(lang, default_language_settings(lang));
}

const language_settings &language_table::at(language lang) const {
    return settings.at(lang);
}

language_settings &language_table::at(language lang) {
    return settings.at(lang);
}

static chrono::milliseconds seconds_from_json(const nlohmann::json &j) {
    return chrono::milliseconds(static_cast<long long>(j.get<double>() * 1000));
}

void from_json(const nlohmann::json &j, language_settings &settings) {
    if (j.count("extension")) j.at("extension").get_to(settings.extension);
    if (j.count("source_name")) j.at("source_name").get_to(settings.source_name);
    if (j.count("compiled")) j.at("compiled").get_to(settings.compiled);
    if (j.count("compilers")) j.at("compilers").get_to(settings.compilers);
    if (j.count("compiler_probe")) j.at("compiler_probe").get_to(settings.compiler_probe);
    if (j.count("runtimes")) j.at("runtimes").get_to(settings.runtimes);
    if (j.count("runtime_probe")) j.at("runtime_probe").get_to(settings.runtime_probe);
    if (j.count("compile_flags")) j.at("compile_flags").get_to(settings.compile_flags);
    if (j.count("run_flags")) j.at("run_flags").get_to(settings.run_flags);
    if (j.count("compile_timeout")) settings.compile_timeout = seconds_from_json(j.at("compile_timeout"));
    if (j.count("run_timeout")) settings.run_timeout = seconds_from_json(j.at("run_timeout"));
}

void from_json(const nlohmann::json &j, language_table &table) {
    for (auto &[tag, value] : j.items())
        from_json(value, table.at(parse_language(tag)));
}

}  // namespace ojudge
