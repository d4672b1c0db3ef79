#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 提交独占的工作目录，位于 RUN_DIR 下以随机 uuid 命名
 * 析构时删除整个目录，DEBUG 模式下保留以便检查评测产生的文件
 */
struct workspace {
    workspace();
    ~workspace();

    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief 在工作目录中创建子目录
     * @param name 子目录名，不允许包含 ".."
     */
    std::filesystem::path subdirectory(const std::string &name) const;

    /**
     * @brief 写入工作目录中的文件
     * @param name 相对于 dir 的文件名，不允许包含 ".."
     */
    std::filesystem::path write_file(const std::filesystem::path &dir, const std::string &name, const std::string &content) const;

private:
    std::filesystem::path root;
};

}  // namespace grader
