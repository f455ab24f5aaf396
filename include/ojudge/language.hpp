#pragma once

#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ojudge {

/**
 * @brief 评测系统支持的编程语言
 * 新增语言时编译器会提示所有需要补充的 switch 分支
 */
enum class language {
    PYTHON,
    C,
    CPP,
    JAVA,
    JAVASCRIPT
};

/**
 * @brief 所有支持的语言，按枚举顺序
 */
const std::vector<language> &all_languages();

/**
 * @brief 根据外部系统使用的语言标记查找语言
 * 接受 "py", "c", "cpp", "java", "js" 以及 "python", "c++", "javascript"，不区分大小写
 * @throw judge_exception 如果语言标记无法识别
 */
language parse_language(const std::string &tag);

/**
 * @brief 语言的短标记，比如 "py"、"cpp"
 */
const char *get_language_tag(language lang);

/**
 * @brief 语言的展示名称，比如 "Python 3"
 */
const char *get_display_name(language lang);

std::ostream &operator<<(std::ostream &os, language lang);

/**
 * @brief 一种语言的编译、运行配置
 */
struct language_settings {
    /**
     * @brief 源文件扩展名，包含点号，比如 ".cpp"
     */
    std::string extension;

    /**
     * @brief 源文件的固定文件名（不含扩展名）
     * 为空时使用随机生成的文件名。
     * 对于 Java，文件名必须和 public 类名一致，因此固定为 Main
     */
    std::string source_name;

    /**
     * @brief 是否存在单独的编译步骤
     */
    bool compiled = false;

    /**
     * @brief 编译器候选路径，按顺序探测，先绝对路径后依赖 PATH 的裸名
     */
    std::vector<std::string> compilers;

    /**
     * @brief 探测编译器时传入的参数，编译器以返回码 0 退出即认为可用
     */
    std::vector<std::string> compiler_probe = {"--version"};

    /**
     * @brief 解释器或虚拟机候选路径，按顺序探测
     * 对于直接运行编译产物的语言（C、C++）为空
     */
    std::vector<std::string> runtimes;

    std::vector<std::string> runtime_probe = {"--version"};

    /**
     * @brief 固定的编译参数，比如优化级别和语言标准
     * @code{.json}
     * ["-std=c++17", "-O2", "-Wall"]
     * @endcode
     */
    std::vector<std::string> compile_flags;

    /**
     * @brief 运行时传给解释器或虚拟机的额外参数
     */
    std::vector<std::string> run_flags;

    std::chrono::milliseconds compile_timeout{15000};

    std::chrono::milliseconds run_timeout{10000};
};

/**
 * @brief 各个语言的内置默认配置
 */
language_settings default_language_settings(language lang);

/**
 * @brief 所有语言的配置表
 * 默认使用内置配置，可以通过配置文件覆盖部分字段
 */
struct language_table {
    language_table();

    const language_settings &at(language lang) const;

    language_settings &at(language lang);

private:
    std::map<language, language_settings> settings;
};

/**
 * @brief 从配置文件覆盖语言配置，只覆盖配置文件中出现的字段
 * @code{.json}
 * {
 *     "compilers": ["/usr/bin/g++"],
 *     "compile_flags": ["-std=c++17", "-O2"],
 *     "compile_timeout": 15,
 *     "run_timeout": 5
 * }
 * @endcode
 * 时间的单位为秒，允许小数
 */
void from_json(const nlohmann::json &j, language_settings &settings);

/**
 * @brief 从配置文件覆盖语言配置表，键为语言标记
 */
void from_json(const nlohmann::json &j, language_table &table);

}  // namespace ojudge
