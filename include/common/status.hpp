#pragma once

#include <string>

namespace grader {

/**
 * @brief 表示单个数据点或整个提交的评测结果
 * 整个提交的结论取所有数据点中最严重的那个，见 aggregate_verdict
 */
enum class verdict {
    /**
     * @brief 用户程序本测试点评测通过
     */
    PASS = 0,

    /**
     * @brief 答案错误
     * 程序正常结束，但是输出和标准输出在比较模式下不一致
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序运行时间超出限制
     * CPU 时间或者墙上时间超出限制都会返回该结果
     */
    TIME_LIMIT = 2,

    /**
     * @brief 用户程序运行内存超限
     */
    MEMORY_LIMIT = 3,

    /**
     * @brief 用户程序出现运行时错误
     * 返回值非零或者被信号杀死
     */
    RUNTIME_ERROR = 4,

    /**
     * @brief 用户程序输出内容过多
     */
    OUTPUT_LIMIT = 5,

    /**
     * @brief 用户程序编译错误
     * 此时所有测试点都不会运行
     */
    COMPILE_ERROR = 6,

    /**
     * @brief 测试点没有运行
     * 因为提交的总时间预算耗尽，或者语言不受支持
     */
    SKIPPED = 7,

    /**
     * @brief 评测被取消
     */
    CANCELLED = 8,

    /**
     * @brief 无法启动编译器或者用户程序
     * 一般是评测机缺少对应的工具链，不是选手程序的问题
     */
    SPAWN_FAILED = 9,

    /**
     * @brief 语言不受支持，只用于整个提交的结论
     */
    UNSUPPORTED_LANGUAGE = 10,

    /**
     * @brief 内部错误，评测系统出错
     */
    SYSTEM_ERROR = 11
};

/**
 * @brief 一次进程执行的最终状态
 */
enum class attempt_status {
    COMPLETED,          // 进程自行结束，返回值为 0
    TIMED_OUT,          // CPU 时间或墙上时间超限被杀死
    MEMORY_EXCEEDED,    // 内存超限被杀死
    OUTPUT_EXCEEDED,    // 输出超限被杀死
    RUNTIME_ERROR,      // 返回值非零或者被信号杀死
    KILLED,             // 因为评测被取消而被杀死
    SPAWN_FAILED        // 进程没能启动
};

/**
 * @brief 资源监控器记录的进程结束原因
 * 一旦记录了超限原因，即使进程随后被其他信号杀死，也以该原因为准
 */
enum class termination_cause {
    NATURAL,
    TIMED_OUT,
    MEMORY_EXCEEDED,
    OUTPUT_EXCEEDED,
    PROCESS_EXCEEDED,   // 会话内的进程数超过限制
    CANCELLED
};

/**
 * @brief 提交在持久化存储中的状态
 */
enum class submission_state {
    PENDING,
    TESTING,
    FINISHED
};

const char *get_display_message(verdict);

/**
 * @brief 评测结果的机器可读名称，如 "time_limit"，用于 JSON 序列化
 */
const char *get_name(verdict);
const char *get_name(attempt_status);
const char *get_name(termination_cause);
const char *get_name(submission_state);

/**
 * @brief 从机器可读名称解析评测结果
 * @throw std::invalid_argument 如果名称不存在
 */
verdict parse_verdict(const std::string &name);

}  // namespace grader
