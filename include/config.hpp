#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "sandbox/limits.hpp"

namespace grader {

/**
 * @brief 自定义比较器（checker）的返回值约定，和 DOMjudge 一致
 */
enum error_codes {
    E_ACCEPTED = 42,
    E_WRONG_ANSWER = 43
};

/**
 * @brief 选手程序编译及运行的根目录
 * 每个提交在这里拥有一个独占的工作目录：
 *
 * RUN_DIR
 * ├── 2b7f1c0e-... // 随机生成的 uuid，一个提交一个
 * │   ├── main.cpp // 选手程序的源代码（文件名由语言决定）
 * │   ├── main // 编译产物
 * │   ├── compile.log // 编译器的输出
 * │   └── checker // 自定义比较器的代码和编译产物
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统不会删除产生的提交目录，
 * 以便手动检查测试产生的文件内容是否符合预期。
 */
extern bool DEBUG;

/**
 * @brief 资源类评测结果（RE/MLE/TLE/OLE）同时出现时如何决定整个提交的结论
 */
enum class tie_break_policy {
    FIRST,      // 取第一个出现的
    SEVERITY    // 按 RE > MLE > TLE > OLE 取最严重的，同等严重时取第一个
};

/**
 * @brief 结果存储的配置
 */
struct store_config {
    /**
     * @brief 存储类型，"file" 或者 "redis"
     */
    std::string type = "file";

    /**
     * @brief file 存储的根目录
     */
    std::filesystem::path directory = "results";

    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password;

    /**
     * @brief redis 键的前缀
     */
    std::string prefix = "grader:";
};

/**
 * @brief 评测引擎的配置
 */
struct engine_config {
    /**
     * @brief 同时评测的提交数，也就是 worker 线程的数量
     */
    std::size_t concurrency = 4;

    /**
     * @brief 等待队列的最大长度，超出的提交会被拒绝
     */
    std::size_t max_queue_depth = 256;

    /**
     * @brief 每个用户同时在队列中或者正在评测的提交数上限，0 表示不限制
     */
    std::size_t max_user_in_flight = 0;

    /**
     * @brief 每个用户每分钟允许提交的次数，0 表示不限制
     */
    std::size_t max_user_per_minute = 0;

    /**
     * @brief 统计 max_user_per_minute 的滑动窗口长度，默认为一分钟
     */
    std::chrono::milliseconds user_rate_window{60000};

    /**
     * @brief 资源监控的轮询间隔
     */
    std::chrono::milliseconds poll_interval{50};

    /**
     * @brief 发送 SIGTERM 之后等待多久发送 SIGKILL
     */
    std::chrono::milliseconds kill_grace{100};

    resource_limits run_limits;
    resource_limits compile_limits{10, 30, 1LL << 30, 64LL << 20, 128};
    resource_limits ceiling{30, 60, 4LL << 30, 256LL << 20, 512};

    /**
     * @brief 一个提交所有测试点的总墙上时间预算，单位为秒
     * 超出预算后剩余的测试点不再运行
     */
    std::optional<double> time_budget;

    tie_break_policy tie_break = tie_break_policy::FIRST;

    std::filesystem::path run_dir = "/tmp/grader";
    bool debug = false;

    /**
     * @brief 是否使用 cgroup 统计内存和 CPU 时间，需要 root 权限
     */
    bool use_cgroup = false;

    /**
     * @brief 写入结果存储失败时的重试次数和初始退避时间
     */
    int persist_attempts = 3;
    std::chrono::milliseconds persist_backoff{100};

    store_config store;
};

void from_json(const nlohmann::json &j, store_config &config);
void from_json(const nlohmann::json &j, engine_config &config);

tie_break_policy parse_tie_break_policy(const std::string &name);

/**
 * @brief 从 JSON 配置文件加载引擎配置，没有出现的键使用默认值
 * @throw config_error 如果配置文件无法读取或者不合法
 */
engine_config load_engine_config(const std::filesystem::path &path);

}  // namespace grader
