#pragma once

#include <sys/types.h>
#include <cstdint>
#include <exception>
#include <string>

struct cgroup;
struct cgroup_controller;

namespace grader {

struct cgroup_exception : public std::exception {
    cgroup_exception(const std::string &cgroup_op, int err);

    const char *what() const noexcept override;

    static void ensure(const std::string &cgroup_op, int err);

private:
    std::string errmsg;
};

/**
 * @brief 表示一个 cgroup 的 controller
 * 评测只用到 memory（内存统计与限制）和 cpuacct（CPU 时间统计）
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    /**
     * @brief 为 controller 添加设定
     */
    void add_value(const std::string &name, int64_t value);

    int64_t get_value_int64(const std::string &name);
};

/**
 * @brief 创建指定 cgroup 的管理器
 * 在析构时释放内存以确保没有内存泄漏
 */
struct cgroup_guard {
    /**
     * @brief 构造函数，调用 libcgroup 的创建函数
     * @param cgroup_name cgroup 的内核名称
     */
    explicit cgroup_guard(const std::string &cgroup_name);

    cgroup_guard(const cgroup_guard &) = delete;
    cgroup_guard &operator=(const cgroup_guard &) = delete;

    /**
     * @brief 析构函数，调用 libcgroup 的释放函数
     */
    ~cgroup_guard();

    /**
     * @brief 在内核中创建这个 cgroup
     * cgroup_guard 在创建时只会记录 cgroup 的信息，而不会对内核中存储的 cgroup
     * 进行修改。通过 create_cgroup 能真正在内核中创建这个 cgroup。
     */
    void create_cgroup(int ignore_ownership);

    cgroup_ctrl add_controller(const std::string &name);

    cgroup_ctrl get_controller(const std::string &name);

    /**
     * @brief 从内核中读入 cgroup 的所有信息
     */
    void get_cgroup();

    /**
     * @brief 将指定的进程移入本 cgroup
     */
    void attach_task(pid_t pid);

    /**
     * @brief 从内核中删除这个 cgroup
     */
    void delete_cgroup();

    /**
     * @brief 初始化 libcgroup，可以重复调用
     */
    static void init();

private:
    struct cgroup *cg;
};

/**
 * @brief 一次执行使用的 memory + cpuacct cgroup
 * 构造时在内核中创建，析构时杀死剩余进程并删除
 */
struct execution_cgroup {
    /**
     * @param memory_limit 内存限制，单位为字节，内存和交换空间限制设为一样以禁止交换
     */
    explicit execution_cgroup(int64_t memory_limit);
    ~execution_cgroup();

    execution_cgroup(const execution_cgroup &) = delete;
    execution_cgroup &operator=(const execution_cgroup &) = delete;

    void attach(pid_t pid);

    /**
     * @brief 当前内存使用量，单位为字节
     */
    int64_t memory_usage();

    /**
     * @brief 内存使用峰值，单位为字节
     */
    int64_t max_memory_usage();

    /**
     * @brief CPU 时间，单位为秒
     */
    double cpu_usage();

    /**
     * @brief 是否触发过 OOM killer
     */
    bool is_oom();

    /**
     * @brief 杀死 cgroup 内所有的进程
     */
    void kill_all(int sig);

    const std::string &name() const;

private:
    std::string cgroup_name;
    bool created = false;
};

}  // namespace grader
