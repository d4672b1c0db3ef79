#pragma once

#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

namespace grader {

/**
 * @brief 一次执行（编译或者运行一个测试点）的资源限制
 * 执行前必须已经完全确定，执行过程中不会再调整
 */
struct resource_limits {
    /**
     * @brief CPU 时间限制，单位为秒，统计整个进程组
     */
    double cpu_time = 1;

    /**
     * @brief 墙上时间限制，单位为秒
     */
    double wall_time = 3;

    /**
     * @brief 常驻内存限制，单位为字节，统计整个进程组
     */
    int64_t memory = 256LL << 20;

    /**
     * @brief stdout 和 stderr 各自允许的最大输出字节数
     */
    int64_t output = 64LL << 20;

    /**
     * @brief 进程数限制，通过 RLIMIT_NPROC 设置
     */
    int processes = 64;
};

/**
 * @brief 提交自带的资源限制，未设置或者非正数的项使用默认值
 */
struct resource_overrides {
    std::optional<double> cpu_time;
    std::optional<double> wall_time;
    std::optional<int64_t> memory;
    std::optional<int64_t> output;
    std::optional<int> processes;
};

/**
 * @brief 语言对资源限制的调整
 * 比如 Java 需要更多的时间和内存：限制 = 原限制 * multiplier + offset
 */
struct limit_adjustment {
    double time_multiplier = 1;
    double time_offset = 0;         // 秒
    double memory_multiplier = 1;
    int64_t memory_offset = 0;      // 字节
};

/**
 * @brief 计算最终的资源限制
 * 依次应用引擎默认值、提交的覆盖值、语言调整，最后截断到引擎的硬上限。
 * @param defaults 引擎默认的资源限制
 * @param overrides 提交给出的资源限制
 * @param adjust 语言对资源限制的调整
 * @param ceiling 引擎的硬上限，任何提交都不能超过
 */
resource_limits resolve_limits(const resource_limits &defaults,
                               const resource_overrides &overrides,
                               const limit_adjustment &adjust,
                               const resource_limits &ceiling);

void from_json(const nlohmann::json &j, resource_limits &limits);
void to_json(nlohmann::json &j, const resource_limits &limits);
void from_json(const nlohmann::json &j, resource_overrides &overrides);
void from_json(const nlohmann::json &j, limit_adjustment &adjust);

}  // namespace grader
