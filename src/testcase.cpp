#include "ojudge/testcase.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/lexical_cast.hpp>
#include "ojudge/common/stl_utils.hpp"

namespace ojudge {
using namespace std;

bool test_case::operator==(const test_case &other) const {
    return ordinal == other.ordinal && input == other.input && expected_output == other.expected_output;
}

ostream &operator<<(ostream &os, const test_case &tc) {
    return os << "#" << tc.ordinal << " (" << tc.input.size() << " bytes input, "
              << tc.expected_output.size() << " bytes expected output)";
}

const char *get_display_message(corpus_format format) {
    switch (format) {
        case corpus_format::BLANK_LINE_SECTIONS: return "blank-line sections";
        case corpus_format::ONE_LINE_PER_CASE: return "one line per case";
        case corpus_format::COUNT_PREFIXED: return "count prefixed";
        case corpus_format::SINGLE_CASE: return "single case";
    }
    return "unknown";
}

// 计数前缀格式允许的最大测试点数量
static constexpr size_t MAX_PREFIXED_COUNT = 1000;

/**
 * @brief 格式检测的结果，parse 直接复用检测时切分好的测试点，
 * 保证数量检查和实际执行使用的是同一份切分
 */
struct detection {
    corpus_format format;
    vector<pair<string, string>> cases;
};

static string unify_newlines(const string &text) {
    string result = boost::algorithm::replace_all_copy(text, "\r\n", "\n");
    boost::algorithm::replace_all(result, "\r", "\n");
    return result;
}

static bool is_blank(const string &line) {
    return trim(line).empty();
}

/**
 * @brief 去掉首尾的空行和末尾的空白字符，保留第一行行首的缩进
 * 期望输出的行首空白是答案的一部分，比如输出图形的题目
 */
static string strip_blank_lines(const string &text) {
    string result = trim_right(text);
    size_t begin = 0;
    while (true) {
        size_t end = result.find('\n', begin);
        if (end == string::npos || !is_blank(result.substr(begin, end - begin))) break;
        begin = end + 1;
    }
    return result.substr(begin);
}

/**
 * @brief 按空行切分，连续的空行视为一个分隔符
 */
static vector<string> split_sections(const string &text) {
    vector<string> sections, current;
    for (auto &line : split(text, '\n')) {
        if (is_blank(line)) {
            if (!current.empty()) sections.push_back(boost::algorithm::join(current, "\n"));
            current.clear();
        } else {
            current.push_back(line);
        }
    }
    if (!current.empty()) sections.push_back(boost::algorithm::join(current, "\n"));
    return sections;
}

static vector<string> non_empty_lines(const string &text) {
    vector<string> lines;
    for (auto &line : split(text, '\n'))
        if (!is_blank(line)) lines.push_back(line);
    return lines;
}

static vector<pair<string, string>> pair_up(const vector<string> &inputs, const vector<string> &outputs) {
    vector<pair<string, string>> cases;
    for (size_t i = 0; i < inputs.size(); ++i)
        cases.emplace_back(inputs[i], outputs[i]);
    return cases;
}

static vector<string> group_lines(const vector<string> &lines, size_t begin, size_t groups) {
    size_t per_group = (lines.size() - begin) / groups;
    vector<string> result;
    for (size_t i = 0; i < groups; ++i) {
        auto first = lines.begin() + begin + i * per_group;
        result.push_back(boost::algorithm::join(vector<string>(first, first + per_group), "\n"));
    }
    return result;
}

static detection detect(const string &raw_inputs, const string &raw_outputs) {
    string inputs = trim(unify_newlines(raw_inputs));
    string outputs = strip_blank_lines(unify_newlines(raw_outputs));

    // 1. 空行分隔的多行测试点
    auto input_sections = split_sections(inputs), output_sections = split_sections(outputs);
    if (input_sections.size() > 1 && input_sections.size() == output_sections.size())
        return {corpus_format::BLANK_LINE_SECTIONS, pair_up(input_sections, output_sections)};

    // 2. 每行一个测试点
    auto input_lines = non_empty_lines(inputs), output_lines = non_empty_lines(outputs);
    if (input_lines.size() > 1 && input_lines.size() == output_lines.size())
        return {corpus_format::ONE_LINE_PER_CASE, pair_up(input_lines, output_lines)};

    // 3. 第一行为测试点数量
    if (!input_lines.empty() && !output_lines.empty()) {
        string first = trim(input_lines[0]);
        if (is_integer(first) && first.size() <= 4) {
            size_t count = boost::lexical_cast<size_t>(first);
            size_t remaining = input_lines.size() - 1;
            // 每个测试点至少要分到一行输入和一行输出
            if (count >= 1 && count <= MAX_PREFIXED_COUNT &&
                remaining >= count && remaining % count == 0 &&
                output_lines.size() >= count && output_lines.size() % count == 0)
                return {corpus_format::COUNT_PREFIXED, pair_up(group_lines(input_lines, 1, count), group_lines(output_lines, 0, count))};
        }
    }

    // 4. 整体作为一个测试点
    return {corpus_format::SINGLE_CASE, {make_pair(inputs, outputs)}};
}

corpus_format test_case_loader::detect_format(const string &raw_inputs, const string &raw_outputs) const {
    return detect(raw_inputs, raw_outputs).format;
}

vector<test_case> test_case_loader::parse(const string &raw_inputs, const string &raw_outputs) const {
    detection result = detect(raw_inputs, raw_outputs);

    vector<test_case> cases;
    int ordinal = 0;
    for (auto &[input, output] : result.cases)
        cases.push_back({trim(input), strip_blank_lines(output), ++ordinal});

    LOG(INFO) << "Detected corpus format: " << get_display_message(result.format) << ", " << cases.size() << " test case(s)";
    return cases;
}

}  // namespace ojudge
