#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/submission.hpp"

namespace grader {

/**
 * @brief 比较选手输出和标准输出
 * 只关心输出内容，不关心资源使用情况
 * @param actual 选手输出
 * @param test 测试点，给出标准输出和比较方式
 * @return PASS 或者 WRONG_ANSWER
 * @throw std::logic_error 如果比较方式是 CHECKER，自定义比较器由评测流水线负责运行
 */
verdict compare_output(const std::string &actual, const test_case &test);

/**
 * @brief 逐字节精确比较
 */
bool compare_exact(const std::string &actual, const std::string &expected);

/**
 * @brief 忽略行末空白字符（空格、制表符、\r）和文末空行的比较
 */
bool compare_trimmed(const std::string &actual, const std::string &expected);

/**
 * @brief 按空白字符分割后逐个比较
 * 未设置误差时所有 token 精确比较；设置了误差时，两边都能完整解析为
 * 有限浮点数的 token，只要绝对误差不超过 abs_epsilon 或者相对误差不超过
 * rel_epsilon 就认为相等。
 */
bool compare_tokens(const std::string &actual, const std::string &expected,
                    std::optional<double> abs_epsilon, std::optional<double> rel_epsilon);

/**
 * @brief 将文本按行切分，去掉每行末尾的空白字符以及文末的空行
 */
std::vector<std::string> normalized_lines(const std::string &text);

/**
 * @brief 将文本按空白字符切分为 token
 */
std::vector<std::string> split_tokens(const std::string &text);

}  // namespace grader
