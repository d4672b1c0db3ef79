#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "common/status.hpp"
#include "config.hpp"
#include "judge/result.hpp"

namespace cpp_redis {
class client;
}

namespace grader::store {

/**
 * @brief 评测结果的持久化存储
 * 以提交 id 为键，重复写入同一个提交会覆盖之前的结果。
 * 实现必须是线程安全的，多个 worker 会同时写入。
 */
struct result_store {
    virtual ~result_store();

    /**
     * @brief 保存评测结果
     * @throw persistence_error 如果写入失败
     */
    virtual void save(const submission_result &result) = 0;

    /**
     * @brief 更新提交的评测状态（等待中、评测中、已完成）
     * @throw persistence_error 如果写入失败
     */
    virtual void set_state(const std::string &submission_id, submission_state state) = 0;
};

/**
 * @brief 将评测结果以 JSON 文件的形式保存在目录中
 *
 * directory
 * ├── <submission id>.json // 评测结果
 * └── <submission id>.state // 评测状态
 */
struct file_result_store : public result_store {
    explicit file_result_store(const std::filesystem::path &directory);

    void save(const submission_result &result) override;
    void set_state(const std::string &submission_id, submission_state state) override;

    std::filesystem::path result_path(const std::string &submission_id) const;
    std::filesystem::path state_path(const std::string &submission_id) const;

private:
    std::filesystem::path directory;
};

/**
 * @brief 将评测结果保存在 Redis 中
 * 评测结果保存在 <prefix>result:<id>，评测状态保存在 <prefix>state:<id>
 */
struct redis_result_store : public result_store {
    explicit redis_result_store(const store_config &config);
    ~redis_result_store();

    void save(const submission_result &result) override;
    void set_state(const std::string &submission_id, submission_state state) override;

private:
    /**
     * @brief 执行 SET 操作，必要时重新建立连接
     */
    void set(const std::string &key, const std::string &value);

    bool connect();

    store_config config;
    std::unique_ptr<cpp_redis::client> client;
    std::mutex mut;
};

/**
 * @brief 根据配置创建结果存储
 * @throw config_error 如果存储类型不受支持
 */
std::unique_ptr<result_store> make_result_store(const store_config &config);

/**
 * @brief 写入失败时以指数退避的方式重试
 * @param write 写入操作，失败时抛出异常
 * @param attempts 最多尝试的次数
 * @param backoff 第一次重试前等待的时间，之后每次翻倍
 * @param what 操作的描述，用于日志
 * @return 是否写入成功，重试次数用尽时返回 false，不会抛出异常
 */
bool persist_with_retry(const std::function<void()> &write, int attempts, std::chrono::milliseconds backoff, const std::string &what);

}  // namespace grader::store
