#include "judge/result.hpp"

namespace grader {
using namespace std;

void to_json(nlohmann::json &j, const execution_attempt &attempt) {
    j = {{"status", get_name(attempt.status)},
         {"exit_code", attempt.exit_code},
         {"signal", attempt.signal},
         {"cpu_time", attempt.cpu_time},
         {"wall_time", attempt.wall_time},
         {"peak_memory", attempt.peak_memory},
         {"stdout", attempt.stdout_data},
         {"stderr", attempt.stderr_data},
         {"stdout_bytes", attempt.stdout_bytes},
         {"stderr_bytes", attempt.stderr_bytes}};
    if (!attempt.error.empty()) j["error"] = attempt.error;
}

void to_json(nlohmann::json &j, const test_result &result) {
    j = {{"index", result.index},
         {"verdict", get_name(result.result)},
         {"attempt", result.attempt}};
    if (!result.message.empty()) j["message"] = result.message;
}

void to_json(nlohmann::json &j, const submission_result &result) {
    j = {{"submission_id", result.submission_id},
         {"verdict", get_name(result.result)},
         {"verdict_test", result.verdict_test},
         {"passed_tests", result.passed_tests},
         {"percent_passed", result.percent_passed},
         {"tests", result.tests},
         {"compile_log", result.compile_log},
         {"logs", result.logs},
         {"total_cpu_time", result.total_cpu_time},
         {"total_wall_time", result.total_wall_time},
         {"peak_memory", result.peak_memory},
         {"finished_at", result.finished_at},
         {"persisted", result.persisted}};
}

}  // namespace grader
