#pragma once

#include <string>

namespace grader {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 生成一个随机的 UUID 字符串，用于命名工作路径
 */
std::string random_uuid();

}  // namespace grader
