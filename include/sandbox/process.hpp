#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "judge/result.hpp"
#include "sandbox/limits.hpp"

namespace grader {

/**
 * @brief 进程运行器的配置
 */
struct runner_options {
    /**
     * @brief 资源监控的轮询间隔
     */
    std::chrono::milliseconds poll_interval{50};

    /**
     * @brief SIGTERM 和 SIGKILL 之间的等待时间
     */
    std::chrono::milliseconds kill_grace{100};

    /**
     * @brief 是否为每次执行创建 cgroup 统计资源使用
     */
    bool use_cgroup = false;
};

/**
 * @brief 一次执行的参数
 */
struct process_request {
    /**
     * @brief 命令，command[0] 不包含 '/' 时在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 工作目录，必须已经存在
     */
    std::filesystem::path workdir;

    /**
     * @brief 标准输入的内容
     */
    std::string stdin_data;

    /**
     * @brief 额外的环境变量，除了 PATH 以外的环境变量都会被清除
     */
    std::map<std::string, std::string> env;

    resource_limits limits;
};

/**
 * @brief 进程运行器，负责启动编译器或者选手程序并收集结果
 *
 * 每次调用 run 启动恰好一个进程：进程调用 setsid 成为新会话和进程组的组长，
 * 设置 CPU 时间、进程数、文件大小和 core dump 的 rlimit，清除 PATH 以外的
 * 环境变量。标准输入以非阻塞的方式写入，stdout 和 stderr 分别读取，超出
 * 输出上限的部分读取后丢弃，只统计字节数。资源限制由 resource_limiter 负责。
 *
 * 进程无法启动（程序不存在、没有权限、工作目录不可用）时返回 SPAWN_FAILED，
 * 而不是非零的返回值。run 不会删除工作目录中的任何文件。
 */
struct process_runner {
    explicit process_runner(runner_options options = {});

    /**
     * @brief 运行一个进程直到它结束或者被终止
     * @param request 执行参数
     * @param cancel 取消令牌，被取消时终止进程组，可以为空
     * @return 执行结果
     * @throw internal_error 如果评测机环境有问题（比如无法创建管道或 cgroup）
     */
    execution_attempt run(const process_request &request, const cancellation_token *cancel = nullptr) const;

private:
    runner_options options;
};

/**
 * @brief 在 PATH 中查找可执行文件
 * @param name 程序名，包含 '/' 时原样返回
 * @param path_env 冒号分隔的目录列表
 * @return 可执行文件路径，找不到时为空
 */
std::string find_executable(const std::string &name, const std::string &path_env);

}  // namespace grader
