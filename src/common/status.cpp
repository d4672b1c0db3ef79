#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<verdict, const char *> verdict_string = boost::assign::map_list_of
    (verdict::PASS, "Accepted")
    (verdict::WRONG_ANSWER, "Wrong Answer")
    (verdict::TIME_LIMIT, "Time Limit Exceeded")
    (verdict::MEMORY_LIMIT, "Memory Limit Exceeded")
    (verdict::RUNTIME_ERROR, "Runtime Error")
    (verdict::OUTPUT_LIMIT, "Output Limit Exceeded")
    (verdict::COMPILE_ERROR, "Compilation Error")
    (verdict::SKIPPED, "Skipped")
    (verdict::CANCELLED, "Cancelled")
    (verdict::SPAWN_FAILED, "Spawn Failed")
    (verdict::UNSUPPORTED_LANGUAGE, "Unsupported Language")
    (verdict::SYSTEM_ERROR, "System Error");

static const unordered_map<verdict, const char *> verdict_name = boost::assign::map_list_of
    (verdict::PASS, "pass")
    (verdict::WRONG_ANSWER, "wrong_answer")
    (verdict::TIME_LIMIT, "time_limit")
    (verdict::MEMORY_LIMIT, "memory_limit")
    (verdict::RUNTIME_ERROR, "runtime_error")
    (verdict::OUTPUT_LIMIT, "output_limit")
    (verdict::COMPILE_ERROR, "compile_error")
    (verdict::SKIPPED, "skipped")
    (verdict::CANCELLED, "cancelled")
    (verdict::SPAWN_FAILED, "spawn_failed")
    (verdict::UNSUPPORTED_LANGUAGE, "unsupported_language")
    (verdict::SYSTEM_ERROR, "system_error");

static const unordered_map<attempt_status, const char *> attempt_status_name = boost::assign::map_list_of
    (attempt_status::COMPLETED, "completed")
    (attempt_status::TIMED_OUT, "timed_out")
    (attempt_status::MEMORY_EXCEEDED, "memory_exceeded")
    (attempt_status::OUTPUT_EXCEEDED, "output_exceeded")
    (attempt_status::RUNTIME_ERROR, "runtime_error")
    (attempt_status::KILLED, "killed")
    (attempt_status::SPAWN_FAILED, "spawn_failed");

static const unordered_map<termination_cause, const char *> termination_cause_name = boost::assign::map_list_of
    (termination_cause::NATURAL, "natural")
    (termination_cause::TIMED_OUT, "timed_out")
    (termination_cause::MEMORY_EXCEEDED, "memory_exceeded")
    (termination_cause::OUTPUT_EXCEEDED, "output_exceeded")
    (termination_cause::PROCESS_EXCEEDED, "process_exceeded")
    (termination_cause::CANCELLED, "cancelled");

static const unordered_map<submission_state, const char *> submission_state_name = boost::assign::map_list_of
    (submission_state::PENDING, "pending")
    (submission_state::TESTING, "testing")
    (submission_state::FINISHED, "finished");
// clang-format on

const char *get_display_message(verdict v) {
    return verdict_string.at(v);
}

const char *get_name(verdict v) {
    return verdict_name.at(v);
}

const char *get_name(attempt_status s) {
    return attempt_status_name.at(s);
}

const char *get_name(termination_cause c) {
    return termination_cause_name.at(c);
}

const char *get_name(submission_state s) {
    return submission_state_name.at(s);
}

verdict parse_verdict(const string &name) {
    for (auto &[key, value] : verdict_name)
        if (name == value) return key;
    throw invalid_argument("Unrecognized verdict " + name);
}

}  // namespace grader
