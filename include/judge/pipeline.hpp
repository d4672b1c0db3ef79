#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "common/cancellation.hpp"
#include "config.hpp"
#include "judge/result.hpp"
#include "judge/submission.hpp"
#include "judge/toolchain.hpp"
#include "sandbox/process.hpp"

namespace grader {

struct workspace;

/**
 * @brief 评测流水线的状态
 *
 * PENDING → COMPILING → COMPILE_FAILED
 * PENDING → COMPILING → COMPILED → RUNNING → SCORED
 * PENDING → RUNNING → SCORED（不需要编译的语言）
 * 任何非终止状态都可能进入 CANCELLED 或者 FAILED
 */
enum class pipeline_state {
    PENDING,
    COMPILING,
    COMPILE_FAILED,
    COMPILED,
    RUNNING,
    SCORED,
    CANCELLED,
    FAILED
};

const char *get_name(pipeline_state state);

/**
 * @brief 将一次执行的最终状态转换为评测结果
 * 正常结束（COMPLETED）的执行需要进一步比较输出，这里返回 PASS
 */
verdict verdict_of(const execution_attempt &attempt);

/**
 * @brief 计算整个提交的结论
 *
 * 严重程度从高到低：CANCELLED > SYSTEM_ERROR > SPAWN_FAILED > COMPILE_ERROR
 * > {RUNTIME_ERROR, MEMORY_LIMIT, TIME_LIMIT, OUTPUT_LIMIT} > WRONG_ANSWER > PASS。
 * 被跳过的测试点视为 TIME_LIMIT（总时间预算耗尽）。同一级别内按 policy 决定。
 *
 * @return 结论以及决定结论的测试点编号（从 1 开始，全部通过或者没有测试点时为 0）
 */
std::pair<verdict, std::size_t> aggregate_verdict(const std::vector<test_result> &tests, tie_break_policy policy);

/**
 * @brief 为没有经过流水线的提交生成结果，每个测试点的结果均为 v
 * 用于在开始评测前就被取消的提交，或者评测线程无法完成评测的提交
 */
submission_result synthesize_result(const submission &submit, verdict v, const std::string &message = "");

/**
 * @brief 一个提交的评测流水线
 * 每个提交使用一个新的流水线实例：编译（如果需要）一次，然后按顺序运行每个测试点。
 * 流水线内部的任何异常都会转换为 SYSTEM_ERROR 结果，不会抛给调用方。
 */
struct execution_pipeline {
    execution_pipeline(const engine_config &config, const toolchain_registry &registry, const process_runner &runner);

    /**
     * @brief 评测一个提交
     * @param submit 要评测的提交
     * @param cancel 取消令牌，可以为空
     * @return 评测结果
     */
    submission_result execute(const submission &submit, const cancellation_token *cancel = nullptr);

    pipeline_state state() const;

    /**
     * @brief 流水线经历过的所有状态，按时间顺序
     */
    const std::vector<pipeline_state> &history() const;

private:
    /**
     * @brief 编译好的自定义比较器
     */
    struct prepared_checker {
        const toolchain_spec *toolchain;
        std::filesystem::path dir;
        resource_limits limits;
    };

    void transit(pipeline_state next);

    void judge_program(const submission &submit, submission_result &result, const cancellation_token *cancel);
    void judge_text(const submission &submit, submission_result &result, const cancellation_token *cancel);

    /**
     * @brief 编译自定义比较器
     * @throw internal_error 如果比较器语言不受支持或者编译失败
     */
    prepared_checker prepare_checker(const submission &submit, workspace &ws, const cancellation_token *cancel);

    /**
     * @brief 运行自定义比较器判断答案是否正确
     */
    test_result run_checker(const prepared_checker &checker, workspace &ws, const test_case &test, test_result tr,
                            const std::string &actual, const cancellation_token *cancel);

    /**
     * @brief 给正常结束的执行评分
     */
    test_result score(std::size_t index, const test_case &test, const execution_attempt &attempt,
                      const std::optional<prepared_checker> &checker, workspace &ws, const cancellation_token *cancel);

    void finalize(submission_result &result) const;

    const engine_config &config;
    const toolchain_registry &registry;
    const process_runner &runner;
    std::vector<pipeline_state> states;
};

}  // namespace grader
