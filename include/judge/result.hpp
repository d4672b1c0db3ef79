#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/status.hpp"

namespace grader {

/**
 * @brief 一次进程执行（编译或者运行一个测试点）的结果
 */
struct execution_attempt {
    attempt_status status = attempt_status::COMPLETED;

    /**
     * @brief 进程的返回值，被信号杀死时为 128 + 信号
     */
    int exit_code = 0;

    /**
     * @brief 杀死进程的信号，进程正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 整个进程组的 CPU 时间，单位为秒
     */
    double cpu_time = 0;

    /**
     * @brief 墙上时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 整个进程组的常驻内存峰值，单位为字节
     */
    int64_t peak_memory = 0;

    /**
     * @brief 截断到输出上限的 stdout 和 stderr
     */
    std::string stdout_data;
    std::string stderr_data;

    /**
     * @brief 进程实际输出的字节数，包括被丢弃的部分
     */
    int64_t stdout_bytes = 0;
    int64_t stderr_bytes = 0;

    /**
     * @brief 进程没能启动时的错误原因
     */
    std::string error;
};

/**
 * @brief 一个测试点的评测结果
 */
struct test_result {
    /**
     * @brief 测试点编号，从 0 开始
     */
    std::size_t index = 0;

    verdict result = verdict::SYSTEM_ERROR;

    /**
     * @brief 测试点没有运行时（编译错误、跳过、取消）为默认值
     */
    execution_attempt attempt;

    /**
     * @brief 自定义比较器的输出，或者其他补充说明
     */
    std::string message;
};

/**
 * @brief 一个提交的评测结果，每个提交只生成一次
 */
struct submission_result {
    std::string submission_id;

    std::vector<test_result> tests;

    verdict result = verdict::SYSTEM_ERROR;

    /**
     * @brief 决定整体结论的测试点编号，从 1 开始，0 表示没有
     */
    std::size_t verdict_test = 0;

    std::size_t passed_tests = 0;

    /**
     * @brief 通过测试点的百分比，向下取整
     */
    int percent_passed = 0;

    std::string compile_log;

    /**
     * @brief 评测过程中的诊断信息，比如系统错误的原因
     */
    std::vector<std::string> logs;

    double total_cpu_time = 0;
    double total_wall_time = 0;
    int64_t peak_memory = 0;

    /**
     * @brief 评测结束的时间戳
     */
    std::time_t finished_at = 0;

    /**
     * @brief 结果是否成功写入结果存储
     */
    bool persisted = false;
};

void to_json(nlohmann::json &j, const execution_attempt &attempt);
void to_json(nlohmann::json &j, const test_result &result);
void to_json(nlohmann::json &j, const submission_result &result);

}  // namespace grader
