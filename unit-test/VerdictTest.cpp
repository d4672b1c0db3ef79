#include "gtest/gtest.h"
#include "judge/pipeline.hpp"

using namespace std;
using namespace grader;

static vector<test_result> make_results(initializer_list<verdict> verdicts) {
    vector<test_result> results;
    for (verdict v : verdicts) {
        test_result tr;
        tr.index = results.size();
        tr.result = v;
        results.push_back(tr);
    }
    return results;
}

TEST(VerdictTest, AllPassed) {
    auto [v, position] = aggregate_verdict(make_results({verdict::PASS, verdict::PASS}), tie_break_policy::FIRST);
    EXPECT_EQ(v, verdict::PASS);
    EXPECT_EQ(position, 0u);
}

TEST(VerdictTest, ResourceFailureOutranksWrongAnswer) {
    auto [v, position] = aggregate_verdict(make_results({verdict::PASS, verdict::WRONG_ANSWER, verdict::RUNTIME_ERROR}),
                                           tie_break_policy::FIRST);
    EXPECT_EQ(v, verdict::RUNTIME_ERROR);
    EXPECT_EQ(position, 3u);
}

TEST(VerdictTest, TieBreakPolicy) {
    auto results = make_results({verdict::PASS, verdict::TIME_LIMIT, verdict::OUTPUT_LIMIT, verdict::RUNTIME_ERROR});

    auto first = aggregate_verdict(results, tie_break_policy::FIRST);
    EXPECT_EQ(first.first, verdict::TIME_LIMIT);
    EXPECT_EQ(first.second, 2u);

    auto severity = aggregate_verdict(results, tie_break_policy::SEVERITY);
    EXPECT_EQ(severity.first, verdict::RUNTIME_ERROR);
    EXPECT_EQ(severity.second, 4u);
}

TEST(VerdictTest, SkippedCountsAsTimeLimit) {
    auto [v, position] = aggregate_verdict(make_results({verdict::PASS, verdict::WRONG_ANSWER, verdict::SKIPPED}),
                                           tie_break_policy::FIRST);
    EXPECT_EQ(v, verdict::TIME_LIMIT);
    EXPECT_EQ(position, 3u);
}

TEST(VerdictTest, SeverityOrder) {
    EXPECT_EQ(aggregate_verdict(make_results({verdict::MEMORY_LIMIT, verdict::COMPILE_ERROR}), tie_break_policy::FIRST).first,
              verdict::COMPILE_ERROR);
    EXPECT_EQ(aggregate_verdict(make_results({verdict::COMPILE_ERROR, verdict::SPAWN_FAILED}), tie_break_policy::FIRST).first,
              verdict::SPAWN_FAILED);
    EXPECT_EQ(aggregate_verdict(make_results({verdict::SPAWN_FAILED, verdict::SYSTEM_ERROR}), tie_break_policy::FIRST).first,
              verdict::SYSTEM_ERROR);
    EXPECT_EQ(aggregate_verdict(make_results({verdict::SYSTEM_ERROR, verdict::CANCELLED}), tie_break_policy::FIRST).first,
              verdict::CANCELLED);
}

TEST(VerdictTest, AttemptStatusMapping) {
    execution_attempt attempt;
    attempt.status = attempt_status::COMPLETED;
    EXPECT_EQ(verdict_of(attempt), verdict::PASS);
    attempt.status = attempt_status::TIMED_OUT;
    EXPECT_EQ(verdict_of(attempt), verdict::TIME_LIMIT);
    attempt.status = attempt_status::MEMORY_EXCEEDED;
    EXPECT_EQ(verdict_of(attempt), verdict::MEMORY_LIMIT);
    attempt.status = attempt_status::OUTPUT_EXCEEDED;
    EXPECT_EQ(verdict_of(attempt), verdict::OUTPUT_LIMIT);
    attempt.status = attempt_status::RUNTIME_ERROR;
    EXPECT_EQ(verdict_of(attempt), verdict::RUNTIME_ERROR);
    attempt.status = attempt_status::KILLED;
    EXPECT_EQ(verdict_of(attempt), verdict::CANCELLED);
    attempt.status = attempt_status::SPAWN_FAILED;
    EXPECT_EQ(verdict_of(attempt), verdict::SPAWN_FAILED);
}

TEST(VerdictTest, Names) {
    EXPECT_STREQ(get_name(verdict::TIME_LIMIT), "time_limit");
    EXPECT_EQ(parse_verdict("wrong_answer"), verdict::WRONG_ANSWER);
    EXPECT_STREQ(get_name(submission_state::TESTING), "testing");
}
