#include "ojudge/common/stl_utils.hpp"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <cctype>

namespace ojudge {
using namespace std;

bool is_integer(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), [](unsigned char c) { return isdigit(c); });
}

vector<string> split(const string &s, char delim) {
    vector<string> result;
    boost::algorithm::split(result, s, [delim](char c) { return c == delim; });
    return result;
}

string trim(const string &s) {
    return boost::algorithm::trim_copy(s);
}

string trim_right(const string &s) {
    return boost::algorithm::trim_right_copy(s);
}

}  // namespace ojudge
