#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "gmock/gmock.h"
#include "store/result_store.hpp"

namespace grader::fixtures {

/**
 * @brief 保存在内存中的结果存储，记录每个提交经历过的状态
 */
struct memory_result_store : public store::result_store {
    void save(const submission_result &result) override {
        std::lock_guard<std::mutex> guard(mut);
        results[result.submission_id] = result;
    }

    void set_state(const std::string &submission_id, submission_state state) override {
        std::lock_guard<std::mutex> guard(mut);
        states[submission_id].push_back(state);
    }

    std::vector<submission_state> states_of(const std::string &submission_id) {
        std::lock_guard<std::mutex> guard(mut);
        return states[submission_id];
    }

    bool has_result(const std::string &submission_id) {
        std::lock_guard<std::mutex> guard(mut);
        return results.count(submission_id) > 0;
    }

    submission_result result_of(const std::string &submission_id) {
        std::lock_guard<std::mutex> guard(mut);
        return results.at(submission_id);
    }

private:
    std::mutex mut;
    std::map<std::string, submission_result> results;
    std::map<std::string, std::vector<submission_state>> states;
};

struct mock_result_store : public store::result_store {
    MOCK_METHOD(void, save, (const submission_result &result), (override));
    MOCK_METHOD(void, set_state, (const std::string &submission_id, submission_state state), (override));
};

}  // namespace grader::fixtures
