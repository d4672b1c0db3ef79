#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace grader {

/**
 * @brief 并发队列，写者读者模型
 * 队列元素按优先级从高到低出队，优先级相同时按入队顺序出队（FIFO）。
 * 队列可以限制最大长度，超出长度的元素将被拒绝入队，而不是无限制地堆积。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @param capacity 队列的最大长度，0 表示不限制
     */
    explicit concurrent_queue(std::size_t capacity = 0) : capacity(capacity) {}

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素为止
     * @return 队列头元素，如果队列已经关闭且为空，返回空
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> mlock(mut);
        while (q.empty() && !closed) cond.wait(mlock);
        if (q.empty()) return std::nullopt;
        auto result = std::move(q.begin()->second);
        q.erase(q.begin());
        return result;
    }

    /**
     * @brief 向队列中插入一个新元素
     * @param priority 优先级，越大越先出队
     * @return 若队列已满或者已经关闭，返回 false 且元素不会入队
     */
    bool push(const T &value, int priority = 0) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed || (capacity > 0 && q.size() >= capacity)) return false;
        q.emplace(key{priority, sequence++}, value);
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 删除所有满足条件的元素
     * @return 被删除的元素
     */
    template <typename Pred>
    std::vector<T> remove_if(Pred &&pred) {
        std::vector<T> removed;
        std::unique_lock<std::mutex> mlock(mut);
        for (auto it = q.begin(); it != q.end();) {
            if (pred(it->second)) {
                removed.push_back(std::move(it->second));
                it = q.erase(it);
            } else {
                ++it;
            }
        }
        return removed;
    }

    /**
     * @brief 关闭队列，之后 push 总是失败，pop 在队列为空时立即返回
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

    std::size_t size() {
        std::unique_lock<std::mutex> mlock(mut);
        return q.size();
    }

private:
    // (优先级, 入队序号)
    using key = std::pair<int, std::uint64_t>;

    // 优先级高的在前，优先级相同时入队早的在前，使得 std::map 的顺序就是出队顺序
    struct key_order {
        bool operator()(const key &a, const key &b) const {
            if (a.first != b.first) return std::greater<int>()(a.first, b.first);
            return a.second < b.second;
        }
    };

    std::map<key, T, key_order> q;
    std::size_t capacity;
    std::uint64_t sequence = 0;
    bool closed = false;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace grader
