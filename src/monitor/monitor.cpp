#include "monitor/monitor.hpp"
#include <glog/logging.h>

namespace grader {
using namespace std;

const char *get_name(worker_state state) {
    switch (state) {
        case worker_state::START: return "start";
        case worker_state::JUDGING: return "judging";
        case worker_state::IDLE: return "idle";
        case worker_state::STOPPED: return "stopped";
        case worker_state::CRASHED: return "crashed";
    }
    return "unknown";
}

monitor::~monitor() {}

void monitor::start_submission(int, const submission &) {}

void monitor::end_submission(int, const submission &, const submission_result &) {}

void monitor::worker_state_changed(int, worker_state, const string &) {}

void monitor::persistence_failed(const submission &, const string &) {}

void monitor::report_error(const string &) {}

void logging_monitor::start_submission(int worker_id, const submission &submit) {
    LOG(INFO) << "Worker " << worker_id << " started judging " << submit << ", language: " << submit.language
              << ", test cases: " << submit.test_cases.size();
}

void logging_monitor::end_submission(int worker_id, const submission &submit, const submission_result &result) {
    LOG(INFO) << "Worker " << worker_id << " finished judging " << submit << ": " << get_name(result.result)
              << " (" << result.passed_tests << "/" << result.tests.size() << " passed, " << result.total_wall_time << "s)";
}

void logging_monitor::worker_state_changed(int worker_id, worker_state state, const string &information) {
    if (state == worker_state::CRASHED)
        LOG(ERROR) << "Worker " << worker_id << " crashed: " << information;
    else
        DLOG(INFO) << "Worker " << worker_id << " is " << get_name(state);
}

void logging_monitor::persistence_failed(const submission &submit, const string &information) {
    LOG(ERROR) << "Unable to persist result of " << submit << ": " << information;
}

void logging_monitor::report_error(const string &message) {
    LOG(ERROR) << message;
}

}  // namespace grader
