#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "sandbox/limits.hpp"

namespace grader {

/**
 * @brief 选手输出和标准输出的比较方式
 */
enum class comparison_mode {
    /**
     * @brief 逐字节精确比较
     */
    EXACT,

    /**
     * @brief 忽略行末空白字符（空格、制表符、\r）和文末空行
     */
    TRIM,

    /**
     * @brief 按空白字符分割后逐个比较
     * 两边都能完整解析为浮点数的 token 在设置了误差时按误差比较
     */
    TOKENS,

    /**
     * @brief 使用提交附带的自定义比较器
     */
    CHECKER
};

/**
 * @brief 一个测试点
 * 测试数据通常很大，因此提交之间通过 shared_ptr 共享，不会复制
 */
struct test_case {
    std::string input;

    std::string expected_output;

    comparison_mode mode = comparison_mode::TRIM;

    /**
     * @brief TOKENS 模式的绝对误差和相对误差，未设置时数字也精确比较
     */
    std::optional<double> abs_epsilon;
    std::optional<double> rel_epsilon;
};

/**
 * @brief 自定义比较器程序
 * 比较器以 <input> <expected> <actual> 三个文件路径作为参数运行，
 * 返回 42 表示答案正确，43 表示答案错误
 */
struct checker_program {
    std::string language;
    std::string source;
};

enum class submission_kind {
    /**
     * @brief 编程题，需要编译运行选手代码
     */
    PROGRAM,

    /**
     * @brief 填空题，选手直接给出每个测试点的答案，不运行任何程序
     */
    TEXT
};

/**
 * @brief 一个选手提交
 * 提交被调度器接受之后就不再修改
 */
struct submission {
    /**
     * @brief 提交 id，调度器用它拒绝重复的提交，结果存储用它作为键
     */
    std::string id;

    /**
     * @brief 提交者 id，用于限制单个用户的提交频率
     */
    std::string user_id;

    submission_kind kind = submission_kind::PROGRAM;

    /**
     * @brief 语言 id，如 "cpp"、"python3"，对应语言配置表中的项
     */
    std::string language;

    std::string source;

    resource_overrides limits;

    /**
     * @brief 所有测试点的总时间预算，单位为秒，未设置时使用引擎默认值
     */
    std::optional<double> time_budget;

    std::vector<std::shared_ptr<const test_case>> test_cases;

    std::optional<checker_program> checker;

    /**
     * @brief TEXT 类型提交的答案，和 test_cases 一一对应
     */
    std::vector<std::string> answers;
};

template <typename T>
T &operator<<(T &os, const submission &submit) {
    os << "Submission[" << submit.id << "]";
    return os;
}

const char *get_name(comparison_mode mode);
comparison_mode parse_comparison_mode(const std::string &name);

void from_json(const nlohmann::json &j, test_case &test);
void from_json(const nlohmann::json &j, checker_program &checker);
void from_json(const nlohmann::json &j, submission &submit);

}  // namespace grader
