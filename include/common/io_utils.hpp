#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 如果文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 写入文本文件
 * 先写入同目录下的临时文件再重命名，因此读者不会看到写了一半的文件，
 * 重复写入同一路径会覆盖旧内容。
 * @throw std::system_error 如果写入或者重命名失败
 */
void write_file_atomically(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，如果拿到的
 * 文件名包含 "../" 或者是绝对路径，那么最后有可能导致工作
 * 目录以外的文件被覆盖。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace grader
