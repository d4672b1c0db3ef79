#include <algorithm>
#include <filesystem>
#include <thread>
#include "gtest/gtest.h"
#include "judge/pipeline.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;
using fixtures::make_submission;
using fixtures::make_test;

class PipelineTest : public ::testing::Test {
protected:
    PipelineTest()
        : config(fixtures::make_test_config()), registry(fixtures::make_test_registry()), runner(make_options(config)) {}

    static runner_options make_options(const engine_config &config) {
        runner_options options;
        options.poll_interval = config.poll_interval;
        options.kill_grace = config.kill_grace;
        return options;
    }

    submission_result judge(const submission &submit, const cancellation_token *cancel = nullptr) {
        execution_pipeline pipeline(config, registry, runner);
        submission_result result = pipeline.execute(submit, cancel);
        history = pipeline.history();
        return result;
    }

    bool visited(pipeline_state state) const {
        return find(history.begin(), history.end(), state) != history.end();
    }

    engine_config config;
    toolchain_registry registry;
    process_runner runner;
    vector<pipeline_state> history;
};

TEST_F(PipelineTest, InterpretedProgramPasses) {
    submission submit = make_submission("sum", "sh", "read a b; echo $((a + b))",
                                        {make_test("1 2\n", "3\n"), make_test("5 7\n", "12\n")});
    submission_result result = judge(submit);
    EXPECT_EQ(result.submission_id, "sum");
    EXPECT_EQ(result.result, verdict::PASS);
    EXPECT_EQ(result.verdict_test, 0u);
    EXPECT_EQ(result.passed_tests, 2u);
    EXPECT_EQ(result.percent_passed, 100);
    ASSERT_EQ(result.tests.size(), 2u);
    EXPECT_EQ(result.tests[1].attempt.stdout_data, "12\n");
    EXPECT_FALSE(visited(pipeline_state::COMPILING));
    EXPECT_EQ(history.back(), pipeline_state::SCORED);
}

TEST_F(PipelineTest, PythonProgramPasses) {
    if (!fixtures::has_program("python3")) GTEST_SKIP() << "python3 is not installed";

    registry = toolchain_registry::load(std::filesystem::path(GRADER_SOURCE_DIR) / "config" / "toolchains.json");
    submission submit = make_submission("print", "python", "print(1+1)", {make_test("", "2\n", comparison_mode::EXACT)});
    submission_result result = judge(submit);
    EXPECT_EQ(result.result, verdict::PASS);
    ASSERT_EQ(result.tests.size(), 1u);
    EXPECT_EQ(result.tests[0].result, verdict::PASS);
}

TEST_F(PipelineTest, CppCompileErrorWithShippedTable) {
    if (!fixtures::has_program("g++")) GTEST_SKIP() << "g++ is not installed";

    registry = toolchain_registry::load(std::filesystem::path(GRADER_SOURCE_DIR) / "config" / "toolchains.json");
    submission submit = make_submission("broken-cpp", "cpp", "int main() { return }", {make_test("", "1"), make_test("", "2")});
    submission_result result = judge(submit);
    EXPECT_EQ(result.result, verdict::COMPILE_ERROR);
    for (auto &test : result.tests) {
        EXPECT_NE(test.result, verdict::PASS);
        EXPECT_NE(test.result, verdict::WRONG_ANSWER);
    }
    EXPECT_EQ(result.passed_tests, 0u);
}

TEST_F(PipelineTest, CompiledProgramPasses) {
    submission submit = make_submission("compiled", "shc", "echo hi", {make_test("", "hi")});
    submission_result result = judge(submit);
    EXPECT_EQ(result.result, verdict::PASS);
    EXPECT_TRUE(visited(pipeline_state::COMPILING));
    EXPECT_TRUE(visited(pipeline_state::COMPILED));
}

TEST_F(PipelineTest, CompileErrorSkipsExecution) {
    submission submit = make_submission("ce", "shc", "if then (", {make_test("", "1"), make_test("", "2")});
    submission_result result = judge(submit);
    EXPECT_EQ(result.result, verdict::COMPILE_ERROR);
    EXPECT_EQ(result.verdict_test, 1u);
    EXPECT_FALSE(result.compile_log.empty());
    ASSERT_EQ(result.tests.size(), 2u);
    for (auto &test : result.tests) {
        EXPECT_EQ(test.result, verdict::COMPILE_ERROR);
        EXPECT_DOUBLE_EQ(test.attempt.wall_time, 0);
    }
    EXPECT_EQ(history.back(), pipeline_state::COMPILE_FAILED);
    EXPECT_FALSE(visited(pipeline_state::RUNNING));
}

TEST_F(PipelineTest, MixedVerdicts) {
    submission submit = make_submission("mixed", "sh", "read n; if [ \"$n\" = 2 ]; then while :; do :; done; fi; echo $n",
                                        {make_test("1", "1"), make_test("2", "2"), make_test("3", "3")});
    submission_result result = judge(submit);
    ASSERT_EQ(result.tests.size(), 3u);
    EXPECT_EQ(result.tests[0].result, verdict::PASS);
    EXPECT_EQ(result.tests[1].result, verdict::TIME_LIMIT);
    EXPECT_EQ(result.tests[2].result, verdict::PASS);
    EXPECT_EQ(result.result, verdict::TIME_LIMIT);
    EXPECT_EQ(result.verdict_test, 2u);
    EXPECT_EQ(result.passed_tests, 2u);
    EXPECT_EQ(result.percent_passed, 66);
}

TEST_F(PipelineTest, WrongAnswer) {
    submission submit = make_submission("wa", "sh", "echo 4", {make_test("", "4"), make_test("", "5")});
    submission_result result = judge(submit);
    EXPECT_EQ(result.result, verdict::WRONG_ANSWER);
    EXPECT_EQ(result.verdict_test, 2u);
}

TEST_F(PipelineTest, OutputLimitFromOverrides) {
    submission submit = make_submission("ole", "sh", "yes", {make_test("", "y")});
    submit.limits.output = 1024;
    submission_result result = judge(submit);
    EXPECT_EQ(result.result, verdict::OUTPUT_LIMIT);
}

TEST_F(PipelineTest, UnsupportedLanguage) {
    submission submit = make_submission("unknown", "brainfuck", "+", {make_test("", "1"), make_test("", "2")});
    submission_result result = judge(submit);
    EXPECT_EQ(result.result, verdict::UNSUPPORTED_LANGUAGE);
    ASSERT_EQ(result.tests.size(), 2u);
    EXPECT_EQ(result.tests[0].result, verdict::SKIPPED);
    EXPECT_EQ(history.back(), pipeline_state::FAILED);
}

TEST_F(PipelineTest, MissingCompilerIsSpawnFailure) {
    submission submit = make_submission("spawn", "broken", "int main() {}", {make_test("", "")});
    submission_result result = judge(submit);
    EXPECT_EQ(result.result, verdict::SPAWN_FAILED);
    EXPECT_EQ(result.tests[0].result, verdict::SPAWN_FAILED);
}

TEST_F(PipelineTest, TimeBudgetSkipsRemainingTests) {
    vector<shared_ptr<const test_case>> tests;
    for (int i = 0; i < 5; ++i) tests.push_back(make_test("", "ok"));
    submission submit = make_submission("budget", "sh", "sleep 0.3; echo ok", tests);
    submit.time_budget = 0.5;
    submission_result result = judge(submit);
    ASSERT_EQ(result.tests.size(), 5u);
    EXPECT_EQ(result.tests[0].result, verdict::PASS);
    EXPECT_EQ(result.tests[1].result, verdict::PASS);
    EXPECT_EQ(result.tests[2].result, verdict::SKIPPED);
    EXPECT_EQ(result.tests[4].result, verdict::SKIPPED);
    EXPECT_EQ(result.result, verdict::TIME_LIMIT);
    EXPECT_EQ(result.verdict_test, 3u);
}

TEST_F(PipelineTest, Cancellation) {
    submission submit = make_submission("cancel", "sh", "sleep 5", {make_test("", ""), make_test("", ""), make_test("", "")});
    submit.limits.wall_time = 10;
    cancellation_token token;
    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(300));
        token.cancel();
    });
    auto begin = chrono::steady_clock::now();
    submission_result result = judge(submit, &token);
    canceller.join();
    EXPECT_LT(chrono::steady_clock::now() - begin, chrono::seconds(3));
    EXPECT_EQ(result.result, verdict::CANCELLED);
    ASSERT_EQ(result.tests.size(), 3u);
    for (auto &test : result.tests) EXPECT_EQ(test.result, verdict::CANCELLED);
    EXPECT_EQ(history.back(), pipeline_state::CANCELLED);
}

TEST_F(PipelineTest, TextSubmission) {
    submission submit = make_submission("text", "", "", {make_test("", "42"), make_test("", "Hello", comparison_mode::EXACT)});
    submit.kind = submission_kind::TEXT;
    submit.answers = {"42\n", "hello"};
    submission_result result = judge(submit);
    ASSERT_EQ(result.tests.size(), 2u);
    EXPECT_EQ(result.tests[0].result, verdict::PASS);
    EXPECT_EQ(result.tests[1].result, verdict::WRONG_ANSWER);
    EXPECT_EQ(result.result, verdict::WRONG_ANSWER);
    EXPECT_EQ(result.verdict_test, 2u);
}

TEST_F(PipelineTest, TextSubmissionWithMissingAnswer) {
    submission submit = make_submission("text", "", "", {make_test("", "1"), make_test("", "2")});
    submit.kind = submission_kind::TEXT;
    submit.answers = {"1"};
    submission_result result = judge(submit);
    EXPECT_EQ(result.tests[0].result, verdict::PASS);
    EXPECT_EQ(result.tests[1].result, verdict::WRONG_ANSWER);
}

TEST_F(PipelineTest, CustomChecker) {
    submission submit = make_submission("checker", "sh", "read n; echo $n",
                                        {make_test("5", "3", comparison_mode::CHECKER),
                                         make_test("1", "3", comparison_mode::CHECKER)});
    // 答案不小于期望值即正确
    submit.checker = checker_program{"sh", "[ \"$(cat \"$3\")\" -ge \"$(cat \"$2\")\" ] && exit 42 || exit 43"};
    submission_result result = judge(submit);
    ASSERT_EQ(result.tests.size(), 2u);
    EXPECT_EQ(result.tests[0].result, verdict::PASS);
    EXPECT_EQ(result.tests[1].result, verdict::WRONG_ANSWER);
    EXPECT_EQ(result.result, verdict::WRONG_ANSWER);
}

TEST_F(PipelineTest, CheckerWithUnexpectedExitCode) {
    submission submit = make_submission("checker", "sh", "echo 1", {make_test("", "1", comparison_mode::CHECKER)});
    submit.checker = checker_program{"sh", "exit 1"};
    submission_result result = judge(submit);
    EXPECT_EQ(result.tests[0].result, verdict::SYSTEM_ERROR);
    EXPECT_EQ(result.result, verdict::SYSTEM_ERROR);
}

TEST_F(PipelineTest, CheckerCompileFailure) {
    submission submit = make_submission("checker", "sh", "echo 1", {make_test("", "1", comparison_mode::CHECKER)});
    submit.checker = checker_program{"shc", "if then ("};
    submission_result result = judge(submit);
    EXPECT_EQ(result.result, verdict::SYSTEM_ERROR);
    EXPECT_FALSE(result.logs.empty());
    EXPECT_EQ(history.back(), pipeline_state::FAILED);
}

TEST_F(PipelineTest, NoTestCases) {
    submission submit = make_submission("empty", "sh", "echo 1", {});
    submission_result result = judge(submit);
    EXPECT_EQ(result.result, verdict::SYSTEM_ERROR);
    EXPECT_TRUE(result.tests.empty());
}

TEST_F(PipelineTest, SynthesizedResult) {
    submission submit = make_submission("synth", "sh", "", {make_test("", ""), make_test("", "")});
    submission_result result = synthesize_result(submit, verdict::CANCELLED, "cancelled before execution");
    EXPECT_EQ(result.result, verdict::CANCELLED);
    EXPECT_EQ(result.verdict_test, 1u);
    ASSERT_EQ(result.tests.size(), 2u);
    EXPECT_EQ(result.tests[1].result, verdict::CANCELLED);
    EXPECT_EQ(result.logs.size(), 1u);
}
