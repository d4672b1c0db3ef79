#include "judge/pipeline.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <algorithm>
#include <ctime>
#include <stdexcept>
#include <unordered_map>
#include "common/exceptions.hpp"
#include "judge/comparator.hpp"
#include "judge/workspace.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

/**
 * @brief 编译日志和比较器输出保存的最大长度
 */
const size_t MAX_LOG_SIZE = 64 * 1024;

// clang-format off
static const unordered_map<pipeline_state, const char *> pipeline_state_name = boost::assign::map_list_of
    (pipeline_state::PENDING, "pending")
    (pipeline_state::COMPILING, "compiling")
    (pipeline_state::COMPILE_FAILED, "compile_failed")
    (pipeline_state::COMPILED, "compiled")
    (pipeline_state::RUNNING, "running")
    (pipeline_state::SCORED, "scored")
    (pipeline_state::CANCELLED, "cancelled")
    (pipeline_state::FAILED, "failed");
// clang-format on

const char *get_name(pipeline_state state) {
    return pipeline_state_name.at(state);
}

static string truncate_log(const string &log) {
    if (log.size() <= MAX_LOG_SIZE) return log;
    return log.substr(0, MAX_LOG_SIZE) + "\n[truncated]";
}

static int verdict_rank(verdict v) {
    switch (v) {
        case verdict::CANCELLED: return 6;
        case verdict::SYSTEM_ERROR: return 5;
        case verdict::SPAWN_FAILED: return 4;
        case verdict::COMPILE_ERROR: return 3;
        case verdict::RUNTIME_ERROR:
        case verdict::MEMORY_LIMIT:
        case verdict::TIME_LIMIT:
        case verdict::OUTPUT_LIMIT:
        case verdict::SKIPPED: return 2;
        case verdict::WRONG_ANSWER: return 1;
        default: return 0;
    }
}

static int resource_severity(verdict v) {
    switch (v) {
        case verdict::RUNTIME_ERROR: return 4;
        case verdict::MEMORY_LIMIT: return 3;
        case verdict::TIME_LIMIT:
        case verdict::SKIPPED: return 2;
        case verdict::OUTPUT_LIMIT: return 1;
        default: return 0;
    }
}

verdict verdict_of(const execution_attempt &attempt) {
    switch (attempt.status) {
        case attempt_status::COMPLETED: return verdict::PASS;
        case attempt_status::TIMED_OUT: return verdict::TIME_LIMIT;
        case attempt_status::MEMORY_EXCEEDED: return verdict::MEMORY_LIMIT;
        case attempt_status::OUTPUT_EXCEEDED: return verdict::OUTPUT_LIMIT;
        case attempt_status::RUNTIME_ERROR: return verdict::RUNTIME_ERROR;
        case attempt_status::KILLED: return verdict::CANCELLED;
        case attempt_status::SPAWN_FAILED: return verdict::SPAWN_FAILED;
    }
    return verdict::SYSTEM_ERROR;
}

pair<verdict, size_t> aggregate_verdict(const vector<test_result> &tests, tie_break_policy policy) {
    const test_result *decisive = nullptr;
    size_t position = 0;
    for (size_t i = 0; i < tests.size(); ++i) {
        const test_result &test = tests[i];
        if (test.result == verdict::PASS) continue;
        if (!decisive) {
            decisive = &test;
            position = i;
            continue;
        }

        int rank = verdict_rank(test.result), best = verdict_rank(decisive->result);
        bool replace = rank > best;
        if (rank == best && rank == 2 && policy == tie_break_policy::SEVERITY)
            replace = resource_severity(test.result) > resource_severity(decisive->result);
        if (replace) {
            decisive = &test;
            position = i;
        }
    }

    if (!decisive) return {verdict::PASS, 0};
    verdict v = decisive->result == verdict::SKIPPED ? verdict::TIME_LIMIT : decisive->result;
    return {v, position + 1};
}

execution_pipeline::execution_pipeline(const engine_config &config, const toolchain_registry &registry, const process_runner &runner)
    : config(config), registry(registry), runner(runner), states{pipeline_state::PENDING} {}

pipeline_state execution_pipeline::state() const {
    return states.back();
}

const vector<pipeline_state> &execution_pipeline::history() const {
    return states;
}

void execution_pipeline::transit(pipeline_state next) {
    states.push_back(next);
}

/**
 * @brief 为还没有结果的测试点生成相同的结果
 */
static void fill_remaining(submission_result &result, size_t total, verdict v) {
    for (size_t i = result.tests.size(); i < total; ++i) {
        test_result tr;
        tr.index = i;
        tr.result = v;
        result.tests.push_back(move(tr));
    }
}

submission_result synthesize_result(const submission &submit, verdict v, const string &message) {
    submission_result result;
    result.submission_id = submit.id;
    fill_remaining(result, submit.test_cases.size(), v);
    result.result = v;
    result.verdict_test = result.tests.empty() ? 0 : 1;
    if (!message.empty()) result.logs.push_back(message);
    result.finished_at = time(nullptr);
    return result;
}

submission_result execution_pipeline::execute(const submission &submit, const cancellation_token *cancel) {
    submission_result result;
    result.submission_id = submit.id;

    try {
        if (submit.test_cases.empty())
            throw invalid_argument(submit.id + " has no test cases");

        if (submit.kind == submission_kind::TEXT)
            judge_text(submit, result, cancel);
        else
            judge_program(submit, result, cancel);
    } catch (grader_exception &ex) {
        LOG(ERROR) << submit << " failed with internal error: " << ex.what();
        DLOG(ERROR) << ex;
        transit(pipeline_state::FAILED);
        result.tests.clear();
        fill_remaining(result, submit.test_cases.size(), verdict::SYSTEM_ERROR);
        result.result = verdict::SYSTEM_ERROR;
        result.logs.push_back(ex.what());
    } catch (std::exception &ex) {
        LOG(ERROR) << submit << " failed with unexpected exception: " << ex.what();
        transit(pipeline_state::FAILED);
        result.tests.clear();
        fill_remaining(result, submit.test_cases.size(), verdict::SYSTEM_ERROR);
        result.result = verdict::SYSTEM_ERROR;
        result.logs.push_back(ex.what());
    }

    finalize(result);
    LOG(INFO) << submit << " finished with " << get_display_message(result.result)
              << ", passed " << result.passed_tests << "/" << result.tests.size();
    return result;
}

void execution_pipeline::judge_program(const submission &submit, submission_result &result, const cancellation_token *cancel) {
    const size_t total = submit.test_cases.size();

    const toolchain_spec *toolchain = registry.resolve(submit.language);
    if (!toolchain) {
        LOG(WARNING) << submit << " uses unsupported language " << submit.language;
        transit(pipeline_state::FAILED);
        fill_remaining(result, total, verdict::SKIPPED);
        result.result = verdict::UNSUPPORTED_LANGUAGE;
        result.logs.push_back("Unsupported language " + submit.language);
        return;
    }

    workspace ws;
    fs::path program_dir = ws.subdirectory("program");
    ws.write_file(program_dir, toolchain->source_name, submit.source);

    if (toolchain->needs_compile()) {
        transit(pipeline_state::COMPILING);
        if (cancel && cancel->is_cancelled()) {
            transit(pipeline_state::CANCELLED);
            fill_remaining(result, total, verdict::CANCELLED);
            return;
        }

        process_request request;
        request.command = toolchain->compile_args(program_dir);
        request.workdir = program_dir;
        request.env = toolchain->environment(program_dir);
        request.limits = resolve_limits(config.compile_limits, {}, toolchain->compile_adjust, config.ceiling);

        execution_attempt attempt = runner.run(request, cancel);
        result.compile_log = truncate_log(attempt.stdout_data + attempt.stderr_data);
        result.total_cpu_time += attempt.cpu_time;
        result.total_wall_time += attempt.wall_time;

        switch (attempt.status) {
            case attempt_status::COMPLETED:
                transit(pipeline_state::COMPILED);
                break;
            case attempt_status::SPAWN_FAILED:
                LOG(ERROR) << submit << " unable to start compiler: " << attempt.error;
                transit(pipeline_state::FAILED);
                fill_remaining(result, total, verdict::SPAWN_FAILED);
                result.logs.push_back(attempt.error);
                return;
            case attempt_status::KILLED:
                transit(pipeline_state::CANCELLED);
                fill_remaining(result, total, verdict::CANCELLED);
                return;
            default:
                DLOG(INFO) << submit << " compilation failed: " << get_name(attempt.status);
                transit(pipeline_state::COMPILE_FAILED);
                fill_remaining(result, total, verdict::COMPILE_ERROR);
                if (attempt.status != attempt_status::RUNTIME_ERROR)
                    result.logs.push_back(fmt::format("Compilation terminated: {}", get_name(attempt.status)));
                return;
        }
    }

    optional<prepared_checker> checker;
    if (submit.checker) checker = prepare_checker(submit, ws, cancel);

    transit(pipeline_state::RUNNING);

    process_request request;
    request.command = toolchain->run_args(program_dir);
    request.workdir = program_dir;
    request.env = toolchain->environment(program_dir);
    request.limits = resolve_limits(config.run_limits, submit.limits, toolchain->run_adjust, config.ceiling);
    DLOG(INFO) << submit << " run limits: " << nlohmann::json(request.limits).dump();

    optional<double> budget = submit.time_budget ? submit.time_budget : config.time_budget;
    double spent = 0;

    for (size_t i = 0; i < total; ++i) {
        if (cancel && cancel->is_cancelled()) {
            transit(pipeline_state::CANCELLED);
            fill_remaining(result, total, verdict::CANCELLED);
            return;
        }
        if (budget && spent >= *budget) {
            LOG(INFO) << submit << " exhausted time budget, skipping " << total - i << " tests";
            result.logs.push_back(fmt::format("Time budget of {:.3f}s exhausted at test {}", *budget, i + 1));
            fill_remaining(result, total, verdict::SKIPPED);
            break;
        }

        const test_case &test = *submit.test_cases[i];
        request.stdin_data = test.input;
        execution_attempt attempt = runner.run(request, cancel);
        spent += attempt.wall_time;

        test_result tr = score(i, test, attempt, checker, ws, cancel);
        DLOG(INFO) << submit << " test " << i + 1 << ": " << get_name(tr.result)
                   << fmt::format(" ({:.3f}s, {}KB)", tr.attempt.cpu_time, tr.attempt.peak_memory / 1024);
        bool cancelled = tr.result == verdict::CANCELLED;
        result.tests.push_back(move(tr));

        if (cancelled) {
            transit(pipeline_state::CANCELLED);
            fill_remaining(result, total, verdict::CANCELLED);
            return;
        }
    }

    transit(pipeline_state::SCORED);
}

void execution_pipeline::judge_text(const submission &submit, submission_result &result, const cancellation_token *cancel) {
    const size_t total = submit.test_cases.size();

    unique_ptr<workspace> ws;
    optional<prepared_checker> checker;
    if (submit.checker) {
        ws = make_unique<workspace>();
        checker = prepare_checker(submit, *ws, cancel);
    }

    transit(pipeline_state::RUNNING);
    for (size_t i = 0; i < total; ++i) {
        if (cancel && cancel->is_cancelled()) {
            transit(pipeline_state::CANCELLED);
            fill_remaining(result, total, verdict::CANCELLED);
            return;
        }

        const test_case &test = *submit.test_cases[i];
        test_result tr;
        tr.index = i;
        if (i >= submit.answers.size()) {
            tr.result = verdict::WRONG_ANSWER;
            tr.message = "No answer";
        } else if (test.mode == comparison_mode::CHECKER) {
            if (!checker)
                throw internal_error(fmt::format("Test {} requires a checker program", i + 1));
            tr = run_checker(*checker, *ws, test, move(tr), submit.answers[i], cancel);
        } else {
            tr.result = compare_output(submit.answers[i], test);
        }
        result.tests.push_back(move(tr));
    }
    transit(pipeline_state::SCORED);
}

execution_pipeline::prepared_checker execution_pipeline::prepare_checker(const submission &submit, workspace &ws, const cancellation_token *cancel) {
    const checker_program &program = *submit.checker;
    const toolchain_spec *toolchain = registry.resolve(program.language);
    if (!toolchain)
        throw internal_error("Checker uses unsupported language " + program.language);

    prepared_checker checker{toolchain, ws.subdirectory("checker"), {}};
    ws.write_file(checker.dir, toolchain->source_name, program.source);
    checker.limits = resolve_limits(config.run_limits, {}, toolchain->run_adjust, config.ceiling);

    if (toolchain->needs_compile()) {
        process_request request;
        request.command = toolchain->compile_args(checker.dir);
        request.workdir = checker.dir;
        request.env = toolchain->environment(checker.dir);
        request.limits = resolve_limits(config.compile_limits, {}, toolchain->compile_adjust, config.ceiling);

        execution_attempt attempt = runner.run(request, cancel);
        if (attempt.status != attempt_status::COMPLETED)
            throw internal_error(fmt::format("Checker compilation failed ({}): {}{}{}", get_name(attempt.status),
                                             attempt.error, attempt.stdout_data, truncate_log(attempt.stderr_data)));
    }
    DLOG(INFO) << submit << " checker prepared";
    return checker;
}

test_result execution_pipeline::run_checker(const prepared_checker &checker, workspace &ws, const test_case &test, test_result tr,
                                            const string &actual, const cancellation_token *cancel) {
    fs::path dir = ws.subdirectory("check");
    fs::path input = ws.write_file(dir, "input", test.input);
    fs::path expected = ws.write_file(dir, "expected", test.expected_output);
    fs::path answer = ws.write_file(dir, "actual", actual);

    process_request request;
    request.command = checker.toolchain->run_args(checker.dir);
    request.command.push_back(input.string());
    request.command.push_back(expected.string());
    request.command.push_back(answer.string());
    request.workdir = checker.dir;
    request.env = checker.toolchain->environment(checker.dir);
    request.limits = checker.limits;

    execution_attempt attempt = runner.run(request, cancel);
    tr.message = truncate_log(attempt.stdout_data + attempt.stderr_data);

    bool exited = attempt.status == attempt_status::COMPLETED ||
                  (attempt.status == attempt_status::RUNTIME_ERROR && attempt.signal == 0);
    if (attempt.status == attempt_status::KILLED) {
        tr.result = verdict::CANCELLED;
    } else if (exited && attempt.exit_code == E_ACCEPTED) {
        tr.result = verdict::PASS;
    } else if (exited && attempt.exit_code == E_WRONG_ANSWER) {
        tr.result = verdict::WRONG_ANSWER;
    } else {
        tr.result = verdict::SYSTEM_ERROR;
        if (!attempt.error.empty()) tr.message = attempt.error;
        LOG(WARNING) << "Checker returned unexpected status " << get_name(attempt.status) << " with exit code " << attempt.exit_code;
    }
    return tr;
}

test_result execution_pipeline::score(size_t index, const test_case &test, const execution_attempt &attempt,
                                      const optional<prepared_checker> &checker, workspace &ws, const cancellation_token *cancel) {
    test_result tr;
    tr.index = index;
    tr.attempt = attempt;
    tr.result = verdict_of(attempt);
    if (tr.result != verdict::PASS) {
        if (!attempt.error.empty()) tr.message = attempt.error;
        return tr;
    }

    if (test.mode == comparison_mode::CHECKER) {
        if (!checker)
            throw internal_error(fmt::format("Test {} requires a checker program", index + 1));
        return run_checker(*checker, ws, test, move(tr), attempt.stdout_data, cancel);
    }
    tr.result = compare_output(attempt.stdout_data, test);
    return tr;
}

void execution_pipeline::finalize(submission_result &result) const {
    if (result.result != verdict::UNSUPPORTED_LANGUAGE && !result.tests.empty()) {
        auto [v, position] = aggregate_verdict(result.tests, config.tie_break);
        result.result = v;
        result.verdict_test = position;
    }

    result.passed_tests = count_if(result.tests.begin(), result.tests.end(),
                                   [](const test_result &tr) { return tr.result == verdict::PASS; });
    result.percent_passed = result.tests.empty() ? 0 : (int)(result.passed_tests * 100 / result.tests.size());

    for (auto &tr : result.tests) {
        result.total_cpu_time += tr.attempt.cpu_time;
        result.total_wall_time += tr.attempt.wall_time;
        result.peak_memory = max(result.peak_memory, tr.attempt.peak_memory);
    }
    result.finished_at = time(nullptr);
}

}  // namespace grader
