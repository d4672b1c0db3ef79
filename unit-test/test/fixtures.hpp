#pragma once

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "judge/submission.hpp"
#include "judge/toolchain.hpp"

namespace grader::fixtures {

/**
 * @brief 测试用的语言配置表，只依赖 /bin/sh
 *
 * sh: 直接解释执行
 * shc: 用 sh -n 检查语法作为"编译"，通过后复制为产物
 * python3: 需要机器上安装了 python3
 * broken: 编译器不存在
 */
inline toolchain_registry make_test_registry() {
    return nlohmann::json::parse(R"({
        "languages": [
            {"id": "sh", "kind": "interpreted", "source": "main.sh", "run": ["sh", "{source}"]},
            {"id": "shc", "kind": "compiled", "source": "main.sh", "artifact": "prog.sh",
             "compile": ["sh", "-c", "sh -n \"$0\" && cp \"$0\" \"$1\"", "{source}", "{artifact}"],
             "run": ["sh", "{artifact}"]},
            {"id": "python3", "kind": "interpreted", "source": "main.py", "run": ["python3", "-B", "{source}"]},
            {"id": "broken", "kind": "compiled", "source": "main.c", "artifact": "main",
             "compile": ["/nonexistent/grader-cc", "{source}"], "run": ["{artifact}"]}
        ]
    })").get<toolchain_registry>();
}

/**
 * @brief 测试用的引擎配置，限制较小以便测试快速结束
 */
inline engine_config make_test_config() {
    engine_config config;
    config.concurrency = 2;
    config.poll_interval = std::chrono::milliseconds(10);
    config.kill_grace = std::chrono::milliseconds(50);
    config.run_limits = {1, 2, 256LL << 20, 1LL << 20, 4096};
    config.compile_limits = {5, 10, 512LL << 20, 1LL << 20, 4096};
    config.ceiling = {10, 20, 2LL << 30, 64LL << 20, 8192};
    config.persist_attempts = 2;
    config.persist_backoff = std::chrono::milliseconds(1);
    return config;
}

inline std::shared_ptr<const test_case> make_test(const std::string &input, const std::string &expected,
                                                  comparison_mode mode = comparison_mode::TRIM) {
    auto test = std::make_shared<test_case>();
    test->input = input;
    test->expected_output = expected;
    test->mode = mode;
    return test;
}

inline submission make_submission(const std::string &id, const std::string &language, const std::string &source,
                                  std::vector<std::shared_ptr<const test_case>> tests) {
    submission submit;
    submit.id = id;
    submit.language = language;
    submit.source = source;
    submit.test_cases = std::move(tests);
    return submit;
}

inline bool has_program(const std::string &name) {
    return std::system(("command -v " + name + " > /dev/null 2>&1").c_str()) == 0;
}

}  // namespace grader::fixtures
