#include "ojudge/common/io_utils.hpp"
#include <fstream>
#include <iterator>
#include "ojudge/common/exceptions.hpp"

namespace ojudge {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw workspace_error("unable to open " + path.string() + " for writing");
    fout << content;
    fout.close();
    if (!fout)
        throw workspace_error("unable to write " + path.string());
}

/**
 * @brief 计算 s[i] 开始的合法 UTF-8 字符长度
 * 第二个字节的范围按首字节收紧，排除 overlong 编码、代理区 U+D800 到 U+DFFF 以及超过 U+10FFFF 的码点
 * @return 字符占用的字节数，0 表示 s[i] 开始不是合法的 UTF-8 序列
 */
static size_t utf8_sequence_length(const string &s, size_t i) {
    unsigned char c = (unsigned char)s[i];
    size_t n;
    unsigned char lo = 0x80, hi = 0xBF;  // 第二个字节的取值范围
    if (c <= 0x7F)
        return 1;  // 0bbbbbbb
    else if (c >= 0xC2 && c <= 0xDF)
        n = 1;  // 110bbbbb，排除 overlong 的 0xC0 和 0xC1
    else if (c >= 0xE0 && c <= 0xEF) {
        n = 2;  // 1110bbbb
        if (c == 0xE0) lo = 0xA0;
        if (c == 0xED) hi = 0x9F;
    } else if (c >= 0xF0 && c <= 0xF4) {
        n = 3;  // 11110bbb
        if (c == 0xF0) lo = 0x90;
        if (c == 0xF4) hi = 0x8F;
    } else
        return 0;
    if (i + n >= s.length()) return 0;
    unsigned char second = (unsigned char)s[i + 1];
    if (second < lo || second > hi) return 0;
    for (size_t j = 2; j <= n; ++j)  // 剩下的字节都是 10bbbbbb
        if (((unsigned char)s[i + j] & 0xC0) != 0x80)
            return 0;
    return n + 1;
}

bool utf8_check_is_valid(const string &string) {
    for (size_t i = 0; i < string.length();) {
        size_t len = utf8_sequence_length(string, i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

string utf8_sanitize(const string &string) {
    static const char replacement[] = "\xEF\xBF\xBD";  // U+FFFD
    if (utf8_check_is_valid(string)) return string;

    std::string result;
    result.reserve(string.length());
    for (size_t i = 0; i < string.length();) {
        size_t len = utf8_sequence_length(string, i);
        if (len == 0) {
            result += replacement;
            ++i;
        } else {
            result.append(string, i, len);
            i += len;
        }
    }
    return result;
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() ||
        subpath.find("..") != string::npos ||
        subpath.find('/') != string::npos ||
        subpath.find('\\') != string::npos)
        throw judge_exception("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace ojudge
