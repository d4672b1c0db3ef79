#pragma once

#include <string>
#include "judge/result.hpp"
#include "judge/submission.hpp"

namespace grader {

/**
 * @brief Worker 的状态
 */
enum class worker_state {
    START,    // Worker 已启动，等待提交
    JUDGING,  // Worker 正在评测提交
    IDLE,     // Worker 评测完一个提交，等待下一个提交
    STOPPED,  // Worker 已正常退出
    CRASHED   // Worker 因为异常退出
};

const char *get_name(worker_state state);

/**
 * @brief 执行监控行为
 * 默认实现均为空操作，监控实现只需要覆盖关心的事件。
 * 回调可能在多个 worker 线程中同时调用。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报当前 worker 已经开始评测一个提交
     */
    virtual void start_submission(int worker_id, const submission &submit);

    /**
     * @brief 监控上报当前已经完成一个提交的评测
     * @param submit 提交
     * @param result 评测结果
     */
    virtual void end_submission(int worker_id, const submission &submit, const submission_result &result);

    /**
     * @brief 监控上报当前某个 Worker 的状态
     * @param worker_id Worker 编号
     * @param state Worker 的新状态
     * @param information 如果 Worker 崩溃，则为错误原因，用于日志记录
     */
    virtual void worker_state_changed(int worker_id, worker_state state, const std::string &information);

    /**
     * @brief 评测结果在重试后依然无法写入存储
     */
    virtual void persistence_failed(const submission &submit, const std::string &information);

    /**
     * @brief 上报评测系统错误
     */
    virtual void report_error(const std::string &message);
};

/**
 * @brief 将监控信息写入日志
 */
struct logging_monitor : public monitor {
    void start_submission(int worker_id, const submission &submit) override;
    void end_submission(int worker_id, const submission &submit, const submission_result &result) override;
    void worker_state_changed(int worker_id, worker_state state, const std::string &information) override;
    void persistence_failed(const submission &submit, const std::string &information) override;
    void report_error(const std::string &message) override;
};

}  // namespace grader
