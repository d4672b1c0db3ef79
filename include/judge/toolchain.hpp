#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "sandbox/limits.hpp"

namespace grader {

enum class toolchain_kind {
    /**
     * @brief 需要先编译生成产物再运行，如 C++、Rust
     */
    COMPILED,

    /**
     * @brief 直接由解释器运行源代码，如 Python、Node
     */
    INTERPRETED
};

/**
 * @brief 一种语言的编译运行方式
 *
 * 命令以 argv 数组的形式给出，不经过 shell。参数中只允许出现以下占位符：
 * {workdir}：提交的工作目录
 * {source}：源代码文件的路径
 * {artifact}：编译产物的路径
 * 选手提交的内容永远不会被代入命令。
 */
struct toolchain_spec {
    /**
     * @brief 语言 id，如 "cpp"
     */
    std::string id;

    std::string display_name;

    toolchain_kind kind = toolchain_kind::INTERPRETED;

    /**
     * @brief 源代码在工作目录中的文件名，如 "main.cpp"，Java 需要是 "Main.java"
     */
    std::string source_name;

    /**
     * @brief 编译产物在工作目录中的文件名，如 "main"
     */
    std::string artifact_name;

    /**
     * @brief 编译命令，只有 COMPILED 类型的语言才有
     */
    std::optional<std::vector<std::string>> compile_command;

    std::vector<std::string> run_command;

    /**
     * @brief 编译和运行时额外设置的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 编译和运行时对资源限制的调整
     */
    limit_adjustment compile_adjust;
    limit_adjustment run_adjust;

    bool needs_compile() const;

    /**
     * @brief 代入占位符得到编译命令
     * @throw std::logic_error 如果该语言不需要编译
     */
    std::vector<std::string> compile_args(const std::filesystem::path &workdir) const;

    /**
     * @brief 代入占位符得到运行命令
     */
    std::vector<std::string> run_args(const std::filesystem::path &workdir) const;

    /**
     * @brief 代入占位符得到额外的环境变量
     */
    std::map<std::string, std::string> environment(const std::filesystem::path &workdir) const;

private:
    std::string expand(std::string arg, const std::filesystem::path &workdir) const;

    std::vector<std::string> expand(const std::vector<std::string> &templ, const std::filesystem::path &workdir) const;
};

/**
 * @brief 语言配置表
 * 在启动时从 JSON 文件加载，之后只读，因此可以被多个 worker 同时访问
 */
struct toolchain_registry {
    toolchain_registry() = default;
    explicit toolchain_registry(std::vector<toolchain_spec> specs);

    /**
     * @brief 从 JSON 配置文件加载语言配置表
     * @throw config_error 如果配置文件不合法
     */
    static toolchain_registry load(const std::filesystem::path &path);

    /**
     * @brief 查找语言配置
     * @return 语言配置，如果语言不存在返回 nullptr
     */
    const toolchain_spec *resolve(const std::string &language) const;

    std::vector<std::string> languages() const;

private:
    std::map<std::string, toolchain_spec> specs;
};

void from_json(const nlohmann::json &j, toolchain_spec &spec);
void from_json(const nlohmann::json &j, toolchain_registry &registry);

}  // namespace grader
