#include "store/result_store.hpp"
#include <glog/logging.h>
#include <cpp_redis/cpp_redis>
#include <system_error>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader::store {
using namespace std;
namespace fs = std::filesystem;

result_store::~result_store() {}

file_result_store::file_result_store(const fs::path &directory) : directory(directory) {
    error_code ec;
    fs::create_directories(directory, ec);
    if (ec)
        throw config_error("unable to create result directory " + directory.string() + ": " + ec.message());
}

fs::path file_result_store::result_path(const string &submission_id) const {
    return directory / (assert_safe_path(submission_id) + ".json");
}

fs::path file_result_store::state_path(const string &submission_id) const {
    return directory / (assert_safe_path(submission_id) + ".state");
}

void file_result_store::save(const submission_result &result) {
    try {
        nlohmann::json j = result;
        write_file_atomically(result_path(result.submission_id), j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
    } catch (std::exception &e) {
        throw persistence_error("unable to save result of " + result.submission_id + ": " + e.what());
    }
}

void file_result_store::set_state(const string &submission_id, submission_state state) {
    try {
        write_file_atomically(state_path(submission_id), get_name(state));
    } catch (std::exception &e) {
        throw persistence_error("unable to save state of " + submission_id + ": " + e.what());
    }
}

redis_result_store::redis_result_store(const store_config &config)
    : config(config), client(make_unique<cpp_redis::client>()) {}

redis_result_store::~redis_result_store() {
    if (client->is_connected()) client->disconnect();
}

bool redis_result_store::connect() {
    LOG(INFO) << "Redis: Setup connection with server " << config.host << ":" << config.port;
    try {
        client->connect(config.host, config.port,
                        [](const string &host, size_t port, cpp_redis::connect_state status) {
                            if (status == cpp_redis::connect_state::dropped) {
                                LOG(INFO) << "Redis: client disconnected from " << host << ":" << port;
                            }
                        });
        if (!config.password.empty()) {
            auto future = client->auth(config.password);
            client->sync_commit();
            cpp_redis::reply reply = future.get();
            if (!reply.ok()) {
                LOG(ERROR) << "Redis: Auth failed: " << reply.error();
                return false;
            }
        }
    } catch (cpp_redis::redis_error &e) {
        LOG(ERROR) << "Redis: Unable to connect to redis server " << config.host << ":" << config.port << ": " << e.what();
        return false;
    }
    return client->is_connected();
}

void redis_result_store::set(const string &key, const string &value) {
    lock_guard<mutex> guard(mut);
    if (!client->is_connected() && !connect())
        throw persistence_error("unable to connect to redis server " + config.host + ":" + to_string(config.port));

    try {
        auto future = client->set(key, value);
        client->sync_commit();
        cpp_redis::reply reply = future.get();
        if (!reply.ok())
            throw persistence_error("Redis: unable to set " + key + ": " + reply.error());
    } catch (cpp_redis::redis_error &e) {
        // 连接已经失效，下次写入时重新连接
        client = make_unique<cpp_redis::client>();
        throw persistence_error("Redis: unable to set " + key + ": " + e.what());
    }
}

void redis_result_store::save(const submission_result &result) {
    nlohmann::json j = result;
    set(config.prefix + "result:" + result.submission_id, j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void redis_result_store::set_state(const string &submission_id, submission_state state) {
    set(config.prefix + "state:" + submission_id, get_name(state));
}

unique_ptr<result_store> make_result_store(const store_config &config) {
    if (config.type == "file")
        return make_unique<file_result_store>(config.directory);
    else if (config.type == "redis")
        return make_unique<redis_result_store>(config);
    else
        throw config_error("Unrecognized result store type " + config.type);
}

bool persist_with_retry(const function<void()> &write, int attempts, chrono::milliseconds backoff, const string &what) {
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            write();
            return true;
        } catch (std::exception &e) {
            LOG(WARNING) << "Unable to persist " << what << " (attempt " << attempt << "/" << attempts << "): " << e.what();
        }
        if (attempt < attempts) {
            this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
    LOG(ERROR) << "Giving up persisting " << what << " after " << attempts << " attempts";
    return false;
}

}  // namespace grader::store
