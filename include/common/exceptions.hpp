#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    template <typename T>
    grader_exception operator<<(const T &t) const {
        return grader_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是评测机环境或者评测系统自身的问题，而不是选手程序的问题
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示配置文件或者语言配置表不合法
 */
struct config_error : public grader_exception {
    config_error();
    explicit config_error(const std::string &message);
};

/**
 * @brief 表示结果写入持久化存储失败
 */
struct persistence_error : public grader_exception {
    persistence_error();
    explicit persistence_error(const std::string &message);
};

/**
 * @brief 表示提交被调度器拒绝，此时不会产生 ticket
 */
struct overloaded_error : public grader_exception {
    enum class reason {
        QUEUE_FULL,         // 等待队列已满
        DUPLICATE,          // 同一个提交已经在队列中或者正在评测
        USER_LIMIT,         // 该用户正在评测的提交数过多
        USER_RATE,          // 该用户提交过于频繁
        SHUTTING_DOWN       // 调度器正在关闭
    };

    overloaded_error(reason why, const std::string &message);

    reason why() const noexcept;

private:
    reason cause;
};

}  // namespace grader
