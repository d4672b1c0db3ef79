#include "sandbox/limits.hpp"
#include <algorithm>
#include <cmath>
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

template <typename T>
static T override_positive(T value, const optional<T> &override_value) {
    if (override_value && *override_value > 0) return *override_value;
    return value;
}

template <typename T>
static T clamp_to_ceiling(T value, T ceiling, T minimum) {
    if (ceiling > 0) value = min(value, ceiling);
    return max(value, minimum);
}

resource_limits resolve_limits(const resource_limits &defaults,
                               const resource_overrides &overrides,
                               const limit_adjustment &adjust,
                               const resource_limits &ceiling) {
    resource_limits limits;
    limits.cpu_time = override_positive(defaults.cpu_time, overrides.cpu_time);
    limits.wall_time = override_positive(defaults.wall_time, overrides.wall_time);
    limits.memory = override_positive(defaults.memory, overrides.memory);
    limits.output = override_positive(defaults.output, overrides.output);
    limits.processes = override_positive(defaults.processes, overrides.processes);

    limits.cpu_time = limits.cpu_time * adjust.time_multiplier + adjust.time_offset;
    limits.wall_time = limits.wall_time * adjust.time_multiplier + adjust.time_offset;
    limits.memory = (int64_t)llround((double)limits.memory * adjust.memory_multiplier) + adjust.memory_offset;

    // 墙上时间不应该比 CPU 时间短，否则 CPU 时间限制没有意义
    limits.wall_time = max(limits.wall_time, limits.cpu_time);

    limits.cpu_time = clamp_to_ceiling(limits.cpu_time, ceiling.cpu_time, 0.001);
    limits.wall_time = clamp_to_ceiling(limits.wall_time, ceiling.wall_time, 0.001);
    limits.memory = clamp_to_ceiling<int64_t>(limits.memory, ceiling.memory, 1LL << 20);
    limits.output = clamp_to_ceiling<int64_t>(limits.output, ceiling.output, 1);
    limits.processes = clamp_to_ceiling(limits.processes, ceiling.processes, 1);
    return limits;
}

void from_json(const nlohmann::json &j, resource_limits &limits) {
    limits.cpu_time = get_value_def(j, limits.cpu_time, "cpu_time");
    limits.wall_time = get_value_def(j, limits.wall_time, "wall_time");
    limits.memory = get_value_def(j, limits.memory, "memory");
    limits.output = get_value_def(j, limits.output, "output");
    limits.processes = get_value_def(j, limits.processes, "processes");
}

void to_json(nlohmann::json &j, const resource_limits &limits) {
    j = {{"cpu_time", limits.cpu_time},
         {"wall_time", limits.wall_time},
         {"memory", limits.memory},
         {"output", limits.output},
         {"processes", limits.processes}};
}

void from_json(const nlohmann::json &j, resource_overrides &overrides) {
    if (exists(j, "cpu_time")) overrides.cpu_time = j.at("cpu_time").get<double>();
    if (exists(j, "wall_time")) overrides.wall_time = j.at("wall_time").get<double>();
    if (exists(j, "memory")) overrides.memory = j.at("memory").get<int64_t>();
    if (exists(j, "output")) overrides.output = j.at("output").get<int64_t>();
    if (exists(j, "processes")) overrides.processes = j.at("processes").get<int>();
}

void from_json(const nlohmann::json &j, limit_adjustment &adjust) {
    adjust.time_multiplier = get_value_def(j, adjust.time_multiplier, "time_multiplier");
    adjust.time_offset = get_value_def(j, adjust.time_offset, "time_offset");
    adjust.memory_multiplier = get_value_def(j, adjust.memory_multiplier, "memory_multiplier");
    adjust.memory_offset = get_value_def(j, adjust.memory_offset, "memory_offset");
}

}  // namespace grader
