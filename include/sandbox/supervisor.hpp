#pragma once

#include <sys/resource.h>
#include <sys/types.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>
#include "common/status.hpp"
#include "sandbox/limits.hpp"

namespace grader {

struct execution_cgroup;

/**
 * @brief /proc/[pid]/stat 中评测关心的字段
 */
struct proc_stat {
    pid_t pid = 0;
    pid_t ppid = 0;
    pid_t pgrp = 0;
    pid_t session = 0;

    /**
     * @brief 进程自身以及已经回收的子进程的 CPU 时间，单位为 clock tick
     */
    uint64_t cpu_ticks = 0;

    /**
     * @brief 常驻内存，单位为页
     */
    int64_t rss_pages = 0;
};

/**
 * @brief 读取 /proc/[pid]/stat
 * @return 进程不存在时返回空
 */
std::optional<proc_stat> read_proc_stat(pid_t pid);

/**
 * @brief 列出会话 sid 内所有的进程
 * 被评测的进程通过 setsid 成为会话首进程，因此它的所有子孙进程，
 * 即使调用 setpgid 换了进程组，也仍然在这个会话中。
 */
std::vector<proc_stat> session_members(pid_t sid);

/**
 * @brief 资源使用情况
 */
struct usage_report {
    termination_cause cause = termination_cause::NATURAL;
    double cpu_time = 0;        // 秒
    double wall_time = 0;       // 秒
    int64_t peak_memory = 0;    // 字节
};

/**
 * @brief 资源监控器
 *
 * 进程启动之后，进程运行器每个轮询周期调用一次 check，监控器统计整个
 * 进程组（会话）的 CPU 时间、常驻内存和进程数，发现超限时终止整个进程组：先发送
 * SIGTERM，经过 grace 时间后仍未结束则发送 SIGKILL。
 *
 * 第一次记录的终止原因不会再改变，即使进程随后因为其他信号结束。
 */
struct resource_limiter {
    /**
     * @param limits 已经完全确定的资源限制
     * @param grace SIGTERM 和 SIGKILL 之间的等待时间
     * @param cgroup 若非空，从 cgroup 中统计内存和 CPU 时间
     */
    resource_limiter(const resource_limits &limits, std::chrono::milliseconds grace, execution_cgroup *cgroup = nullptr);

    /**
     * @brief 开始监控进程 pid，pid 必须是进程组组长
     */
    void supervise(pid_t pid);

    /**
     * @brief 检查资源使用情况，超限时终止进程组
     * @param stdout_bytes 目前为止 stdout 的总输出字节数
     * @param stderr_bytes 目前为止 stderr 的总输出字节数
     * @param cancelled 评测是否已经被取消
     * @return 是否已经开始终止进程组
     */
    bool check(int64_t stdout_bytes, int64_t stderr_bytes, bool cancelled);

    /**
     * @brief 终止进程组，可以重复调用，只有第一次调用的原因会被记录
     */
    void terminate(termination_cause cause);

    /**
     * @brief 向进程组内所有进程发送 SIGKILL
     * 主进程结束之后调用，确保没有子孙进程残留
     */
    void kill_group();

    /**
     * @brief 主进程结束后汇总资源使用情况
     * @param usage wait4 返回的主进程资源使用情况
     */
    usage_report finish(const struct rusage &usage);

    termination_cause cause() const;

    /**
     * @brief 自 supervise 以来经过的墙上时间，单位为秒
     */
    double elapsed() const;

private:
    void sample();
    void signal_group(int sig);

    resource_limits limits;
    std::chrono::milliseconds grace;
    execution_cgroup *cgroup;

    pid_t pid = -1;
    std::chrono::steady_clock::time_point start;
    std::chrono::steady_clock::time_point kill_deadline;
    termination_cause reason = termination_cause::NATURAL;
    bool sigkill_sent = false;

    double cpu_time = 0;
    int64_t peak_memory = 0;
    int processes = 0;  // 最近一次轮询时会话内的进程数
};

}  // namespace grader
