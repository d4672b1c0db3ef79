#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/submission.hpp"

using namespace std;
using namespace grader;
namespace fs = std::filesystem;

TEST(ConfigTest, ShippedConfigurationIsValid) {
    engine_config config = load_engine_config(fs::path(GRADER_SOURCE_DIR) / "config" / "grader.json");
    EXPECT_EQ(config.concurrency, 4u);
    EXPECT_EQ(config.poll_interval, chrono::milliseconds(50));
    EXPECT_EQ(config.run_limits.memory, 256LL << 20);
    EXPECT_EQ(config.tie_break, tie_break_policy::FIRST);
    EXPECT_EQ(config.store.type, "file");
    EXPECT_EQ(config.user_rate_window, chrono::milliseconds(60000));
}

TEST(ConfigTest, MissingKeysUseDefaults) {
    engine_config config = nlohmann::json::parse(R"({"tie_break": "severity", "time_budget": 10})").get<engine_config>();
    EXPECT_EQ(config.concurrency, 4u);
    EXPECT_EQ(config.tie_break, tie_break_policy::SEVERITY);
    ASSERT_TRUE(config.time_budget.has_value());
    EXPECT_DOUBLE_EQ(*config.time_budget, 10);
    EXPECT_DOUBLE_EQ(config.run_limits.cpu_time, 1);
}

TEST(ConfigTest, RejectsInvalidValues) {
    auto parse = [](const string &text) { return nlohmann::json::parse(text).get<engine_config>(); };
    EXPECT_THROW(parse(R"({"poll_interval_ms": 500})"), config_error);
    EXPECT_THROW(parse(R"({"concurrency": 0})"), config_error);
    EXPECT_THROW(parse(R"({"user_rate_window_ms": 0})"), config_error);
    EXPECT_THROW(parse(R"({"tie_break": "last"})"), config_error);
    EXPECT_THROW(parse(R"({"store": {"type": "ftp"}})"), config_error);
    EXPECT_THROW(load_engine_config(RUN_DIR / "missing.json"), config_error);
}

TEST(SubmissionTest, ParsedFromJson) {
    submission submit = nlohmann::json::parse(R"({
        "id": "42",
        "user_id": "alice",
        "language": "cpp",
        "source": "int main() {}",
        "limits": {"cpu_time": 2},
        "time_budget": 5,
        "test_cases": [
            {"input": "1 2", "expected_output": "3"},
            {"expected_output": "0.5", "mode": "tokens", "abs_epsilon": 1e-6}
        ]
    })").get<submission>();
    EXPECT_EQ(submit.id, "42");
    EXPECT_EQ(submit.user_id, "alice");
    EXPECT_EQ(submit.kind, submission_kind::PROGRAM);
    EXPECT_DOUBLE_EQ(*submit.limits.cpu_time, 2);
    EXPECT_DOUBLE_EQ(*submit.time_budget, 5);
    ASSERT_EQ(submit.test_cases.size(), 2u);
    EXPECT_EQ(submit.test_cases[0]->mode, comparison_mode::TRIM);
    EXPECT_EQ(submit.test_cases[1]->mode, comparison_mode::TOKENS);
    EXPECT_DOUBLE_EQ(*submit.test_cases[1]->abs_epsilon, 1e-6);
}

TEST(SubmissionTest, CheckerModeRequiresChecker) {
    EXPECT_ANY_THROW(nlohmann::json::parse(R"({
        "id": "1", "language": "cpp", "source": "",
        "test_cases": [{"expected_output": "1", "mode": "checker"}]
    })").get<submission>());
}

TEST(SubmissionTest, TextSubmission) {
    submission submit = nlohmann::json::parse(R"({
        "id": "7", "kind": "text", "answers": ["A", "B"],
        "test_cases": [{"expected_output": "A"}, {"expected_output": "C"}]
    })").get<submission>();
    EXPECT_EQ(submit.kind, submission_kind::TEXT);
    EXPECT_EQ(submit.answers, vector<string>({"A", "B"}));
}
