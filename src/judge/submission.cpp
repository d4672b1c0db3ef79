#include "judge/submission.hpp"
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<comparison_mode, const char *> comparison_mode_name = boost::assign::map_list_of
    (comparison_mode::EXACT, "exact")
    (comparison_mode::TRIM, "trim")
    (comparison_mode::TOKENS, "tokens")
    (comparison_mode::CHECKER, "checker");
// clang-format on

const char *get_name(comparison_mode mode) {
    return comparison_mode_name.at(mode);
}

comparison_mode parse_comparison_mode(const string &name) {
    for (auto &[key, value] : comparison_mode_name)
        if (name == value) return key;
    throw invalid_argument("Unrecognized comparison mode " + name);
}

void from_json(const nlohmann::json &j, test_case &test) {
    test.input = get_value_def<string>(j, "", "input");
    test.expected_output = get_value<string>(j, "expected_output");
    test.mode = parse_comparison_mode(get_value_def<string>(j, "trim", "mode"));
    if (exists(j, "abs_epsilon")) test.abs_epsilon = j.at("abs_epsilon").get<double>();
    if (exists(j, "rel_epsilon")) test.rel_epsilon = j.at("rel_epsilon").get<double>();
}

void from_json(const nlohmann::json &j, checker_program &checker) {
    checker.language = get_value<string>(j, "language");
    checker.source = get_value<string>(j, "source");
}

void from_json(const nlohmann::json &j, submission &submit) {
    submit.id = get_value<string>(j, "id");
    submit.user_id = get_value_def<string>(j, "", "user_id");

    string kind = get_value_def<string>(j, "program", "kind");
    if (kind == "program")
        submit.kind = submission_kind::PROGRAM;
    else if (kind == "text")
        submit.kind = submission_kind::TEXT;
    else
        throw invalid_argument("Unrecognized submission kind " + kind);

    submit.language = get_value_def<string>(j, "", "language");
    submit.source = get_value_def<string>(j, "", "source");
    if (exists(j, "limits")) submit.limits = j.at("limits").get<resource_overrides>();
    if (exists(j, "time_budget")) submit.time_budget = j.at("time_budget").get<double>();

    submit.test_cases.clear();
    for (auto &test : get_value<nlohmann::json>(j, "test_cases"))
        submit.test_cases.push_back(make_shared<const test_case>(test.get<test_case>()));

    if (exists(j, "checker")) submit.checker = j.at("checker").get<checker_program>();
    submit.answers = get_value_def(j, vector<string>(), "answers");

    bool needs_checker = false;
    for (auto &test : submit.test_cases)
        if (test->mode == comparison_mode::CHECKER) needs_checker = true;
    if (needs_checker && !submit.checker)
        throw invalid_argument("Submission " + submit.id + " uses checker comparison without a checker program");
}

}  // namespace grader
