#include "config.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

filesystem::path RUN_DIR;
bool DEBUG = false;

tie_break_policy parse_tie_break_policy(const string &name) {
    if (name == "first")
        return tie_break_policy::FIRST;
    else if (name == "severity")
        return tie_break_policy::SEVERITY;
    else
        throw config_error("Unrecognized tie break policy " + name);
}

void from_json(const nlohmann::json &j, store_config &config) {
    config.type = get_value_def(j, config.type, "type");
    if (config.type != "file" && config.type != "redis")
        throw config_error("Unrecognized result store type " + config.type);
    config.directory = get_value_def(j, config.directory.string(), "directory");
    config.host = get_value_def(j, config.host, "host");
    config.port = get_value_def(j, config.port, "port");
    config.password = get_value_def(j, config.password, "password");
    config.prefix = get_value_def(j, config.prefix, "prefix");
}

void from_json(const nlohmann::json &j, engine_config &config) {
    config.concurrency = get_value_def(j, config.concurrency, "concurrency");
    if (config.concurrency == 0)
        throw config_error("concurrency must be positive");
    config.max_queue_depth = get_value_def(j, config.max_queue_depth, "max_queue_depth");
    config.max_user_in_flight = get_value_def(j, config.max_user_in_flight, "max_user_in_flight");
    config.max_user_per_minute = get_value_def(j, config.max_user_per_minute, "max_user_per_minute");
    config.user_rate_window = chrono::milliseconds(get_value_def(j, (int)config.user_rate_window.count(), "user_rate_window_ms"));
    if (config.user_rate_window.count() <= 0)
        throw config_error("user_rate_window_ms must be positive");

    int poll_interval = get_value_def(j, (int)config.poll_interval.count(), "poll_interval_ms");
    if (poll_interval < 10 || poll_interval > 100)
        throw config_error("poll_interval_ms must be between 10 and 100");
    config.poll_interval = chrono::milliseconds(poll_interval);
    config.kill_grace = chrono::milliseconds(get_value_def(j, (int)config.kill_grace.count(), "kill_grace_ms"));

    if (exists(j, "run_limits")) config.run_limits = j.at("run_limits").get<resource_limits>();
    if (exists(j, "compile_limits")) config.compile_limits = j.at("compile_limits").get<resource_limits>();
    if (exists(j, "ceiling")) config.ceiling = j.at("ceiling").get<resource_limits>();
    if (exists(j, "time_budget")) config.time_budget = j.at("time_budget").get<double>();

    config.tie_break = parse_tie_break_policy(get_value_def<string>(j, "first", "tie_break"));
    config.run_dir = get_value_def(j, config.run_dir.string(), "run_dir");
    config.debug = get_value_def(j, config.debug, "debug");
    config.use_cgroup = get_value_def(j, config.use_cgroup, "use_cgroup");

    config.persist_attempts = get_value_def(j, config.persist_attempts, "persist_attempts");
    if (config.persist_attempts < 1)
        throw config_error("persist_attempts must be positive");
    config.persist_backoff = chrono::milliseconds(get_value_def(j, (int)config.persist_backoff.count(), "persist_backoff_ms"));

    if (exists(j, "store")) config.store = j.at("store").get<store_config>();
}

engine_config load_engine_config(const filesystem::path &path) {
    try {
        return nlohmann::json::parse(read_file_content(path)).get<engine_config>();
    } catch (config_error &) {
        throw;
    } catch (std::exception &e) {
        throw config_error("Configuration file " + path.string() + " is malformed: " + e.what());
    }
}

}  // namespace grader
