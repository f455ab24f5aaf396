#include "ojudge/execution.hpp"
#include <fmt/core.h>
#include "ojudge/common/stl_utils.hpp"

namespace ojudge {
using namespace std;

const char *get_display_message(execution_phase phase) {
    switch (phase) {
        case execution_phase::COMPILE: return "compile";
        case execution_phase::RUN: return "run";
    }
    return "unknown";
}

string describe(const execution_outcome &result) {
    return visit(overloaded{
                     [](const outcome::success &) -> string { return "Success"; },
                     [](const outcome::compile_error &) -> string { return "Compile Error"; },
                     [](const outcome::runtime_error &r) -> string { return fmt::format("Runtime Error (exit code {})", r.exit_code); },
                     [](const outcome::timeout &t) -> string { return fmt::format("Timeout ({})", get_display_message(t.phase)); },
                     [](const outcome::toolchain_unavailable &t) -> string { return fmt::format("Toolchain Unavailable ({})", get_display_name(t.lang)); },
                     [](const outcome::internal_fault &) -> string { return "Internal Fault"; }},
                 result);
}

void to_json(nlohmann::json &j, const execution_outcome &result) {
    visit(overloaded{
              [&](const outcome::success &r) {
                  j = {{"outcome", "success"}, {"stdout", r.stdout_text}};
              },
              [&](const outcome::compile_error &r) {
                  j = {{"outcome", "compile_error"}, {"message", r.message}};
              },
              [&](const outcome::runtime_error &r) {
                  j = {{"outcome", "runtime_error"}, {"message", r.message}, {"exit_code", r.exit_code}};
              },
              [&](const outcome::timeout &r) {
                  j = {{"outcome", "timeout"}, {"phase", get_display_message(r.phase)}};
              },
              [&](const outcome::toolchain_unavailable &r) {
                  j = {{"outcome", "toolchain_unavailable"}, {"language", get_language_tag(r.lang)}};
              },
              [&](const outcome::internal_fault &r) {
                  j = {{"outcome", "internal_fault"}, {"message", r.message}};
              }},
          result);
}

}  // namespace ojudge
