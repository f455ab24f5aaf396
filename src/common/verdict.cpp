#include "ojudge/common/verdict.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace ojudge {
using namespace std;

// clang-format off
static const unordered_map<verdict, const char *> verdict_string = boost::assign::map_list_of
    (verdict::ACCEPTED, "Accepted")
    (verdict::WRONG_ANSWER, "Wrong Answer")
    (verdict::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (verdict::RUNTIME_ERROR, "Runtime Error")
    (verdict::COMPILATION_ERROR, "Compilation Error")
    (verdict::INTERNAL_ERROR, "Internal Error");

static const unordered_map<verdict, const char *> verdict_code = boost::assign::map_list_of
    (verdict::ACCEPTED, "AC")
    (verdict::WRONG_ANSWER, "WA")
    (verdict::TIME_LIMIT_EXCEEDED, "TLE")
    (verdict::RUNTIME_ERROR, "RE")
    (verdict::COMPILATION_ERROR, "CE")
    (verdict::INTERNAL_ERROR, "IE");
// clang-format on

const char *get_display_message(verdict v) {
    return verdict_string.at(v);
}

const char *get_short_code(verdict v) {
    return verdict_code.at(v);
}

std::ostream &operator<<(std::ostream &os, verdict v) {
    return os << get_display_message(v);
}

}  // namespace ojudge
