#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "config.hpp"
#include "judge/result.hpp"
#include "judge/submission.hpp"
#include "judge/toolchain.hpp"
#include "monitor/monitor.hpp"
#include "sandbox/process.hpp"
#include "store/result_store.hpp"

/**
 * 评测调度相关函数
 *
 * 调度器持有固定数量的 worker 线程，提交按优先级从高到低、同优先级按提交顺序
 * 分配给空闲的 worker。每个 worker 同时只评测一个提交，因此同时运行的评测数
 * 不会超过 concurrency。
 */
namespace grader {

namespace detail {
struct job;
struct scheduler_state;
}  // namespace detail

/**
 * @brief 一个已被接受的提交的凭据
 * 可以用来等待评测结果或者取消评测。ticket 可以被复制，所有副本指向同一个提交。
 */
struct ticket {
    const std::string &submission_id() const;

    /**
     * @brief 评测是否已经结束（包括被取消）
     */
    bool done() const;

    /**
     * @brief 阻塞直到评测结束
     */
    void wait() const;

    /**
     * @brief 最多等待 timeout
     * @return 评测是否已经结束
     */
    bool wait_for(std::chrono::milliseconds timeout) const;

    /**
     * @brief 等待并返回评测结果
     */
    const submission_result &get() const;

    /**
     * @brief 取消评测
     * 如果提交还在队列中，则直接从队列中删除并以 CANCELLED 结束；
     * 如果正在评测，正在运行的进程组会被杀死，剩余的测试点为 CANCELLED；
     * 如果评测已经结束，则没有任何效果。
     */
    void cancel();

private:
    friend struct scheduler;
    explicit ticket(std::shared_ptr<detail::job> job);

    std::shared_ptr<detail::job> job;
};

/**
 * @brief 评测调度器
 * 构造时启动 worker，析构时取消所有未完成的评测并等待 worker 退出。
 */
struct scheduler {
    /**
     * @param config 引擎配置，必须比调度器活得更久
     * @param registry 语言配置表
     * @param runner 进程执行器
     * @param store 评测结果存储
     * @param monitors 监控，回调在 worker 线程中调用
     */
    scheduler(const engine_config &config, const toolchain_registry &registry, const process_runner &runner,
              store::result_store &store, std::vector<std::shared_ptr<monitor>> monitors = {});
    ~scheduler();

    scheduler(const scheduler &) = delete;
    scheduler &operator=(const scheduler &) = delete;

    /**
     * @brief 提交一个评测
     * @param submit 提交，接受后不会再被修改
     * @param priority 优先级，越大越先评测，重测可以使用更高的优先级
     * @return 用于等待或者取消评测的凭据
     * @throw overloaded_error 如果队列已满、提交重复、用户超出限制或者调度器正在关闭
     * @throw std::invalid_argument 如果提交没有测试点
     */
    ticket submit(std::shared_ptr<const submission> submit, int priority = 0);

    /**
     * @brief 关闭调度器，之后的提交都会被拒绝
     * @param drain 为 true 时等待队列中所有提交评测完毕，否则取消队列中和正在评测的提交
     */
    void shutdown(bool drain = true);

    /**
     * @brief 在队列中等待评测的提交数
     */
    std::size_t queued() const;

    /**
     * @brief 已被接受且还没有结束的提交数
     */
    std::size_t in_flight() const;

    /**
     * @brief 滑动窗口内有提交记录的用户数
     */
    std::size_t tracked_users() const;

private:
    std::shared_ptr<detail::scheduler_state> state;
    std::vector<std::thread> workers;
};

}  // namespace grader
