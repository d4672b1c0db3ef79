#pragma once

#include <atomic>

namespace grader {

/**
 * @brief 取消令牌
 * 调度器持有令牌并在取消评测时调用 cancel，评测流水线和进程
 * 运行器轮询 is_cancelled。
 */
struct cancellation_token {
    void cancel();

    bool is_cancelled() const;

private:
    std::atomic<bool> cancelled{false};
};

}  // namespace grader
