#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "store/result_store.hpp"
#include "test/result_stores.hpp"

using namespace std;
using namespace grader;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
namespace fs = std::filesystem;

static submission_result make_result(const string &id, verdict v) {
    submission_result result;
    result.submission_id = id;
    result.result = v;
    test_result tr;
    tr.result = v;
    result.tests.push_back(tr);
    return result;
}

TEST(ResultStoreTest, FileStoreWritesResultAndState) {
    fs::path dir = RUN_DIR / random_uuid();
    store::file_result_store store(dir);

    store.save(make_result("1001", verdict::WRONG_ANSWER));
    store.set_state("1001", submission_state::TESTING);

    auto j = nlohmann::json::parse(read_file_content(store.result_path("1001")));
    EXPECT_EQ(j.at("submission_id").get<string>(), "1001");
    EXPECT_EQ(j.at("verdict").get<string>(), "wrong_answer");
    EXPECT_EQ(read_file_content(store.state_path("1001")), "testing");

    // 重复写入覆盖之前的结果
    store.save(make_result("1001", verdict::PASS));
    store.set_state("1001", submission_state::FINISHED);
    j = nlohmann::json::parse(read_file_content(store.result_path("1001")));
    EXPECT_EQ(j.at("verdict").get<string>(), "pass");
    EXPECT_EQ(read_file_content(store.state_path("1001")), "finished");
}

TEST(ResultStoreTest, FileStoreRejectsUnsafeIds) {
    store::file_result_store store(RUN_DIR / random_uuid());
    EXPECT_THROW(store.save(make_result("../escape", verdict::PASS)), persistence_error);
    EXPECT_THROW(store.set_state("/etc/passwd", submission_state::PENDING), persistence_error);
}

TEST(ResultStoreTest, MakeResultStore) {
    store_config config;
    config.type = "file";
    config.directory = RUN_DIR / random_uuid();
    auto store = store::make_result_store(config);
    ASSERT_NE(dynamic_cast<store::file_result_store *>(store.get()), nullptr);
    EXPECT_TRUE(fs::is_directory(config.directory));

    config.type = "ftp";
    EXPECT_THROW(store::make_result_store(config), config_error);
}

TEST(ResultStoreTest, RedisStoreReportsUnreachableServer) {
    store_config config;
    config.type = "redis";
    config.host = "127.0.0.1";
    config.port = 1;
    store::redis_result_store store(config);
    EXPECT_THROW(store.save(make_result("1", verdict::PASS)), persistence_error);
}

TEST(PersistWithRetryTest, SucceedsAfterTransientFailures) {
    int calls = 0;
    bool ok = store::persist_with_retry(
        [&] {
            if (++calls < 3) throw persistence_error("temporarily unavailable");
        },
        3, chrono::milliseconds(1), "test");
    EXPECT_TRUE(ok);
    EXPECT_EQ(calls, 3);
}

TEST(PersistWithRetryTest, GivesUpAfterAttempts) {
    int calls = 0;
    auto begin = chrono::steady_clock::now();
    bool ok = store::persist_with_retry(
        [&] {
            ++calls;
            throw persistence_error("down");
        },
        3, chrono::milliseconds(10), "test");
    EXPECT_FALSE(ok);
    EXPECT_EQ(calls, 3);
    // 退避时间依次为 10ms 和 20ms
    EXPECT_GE(chrono::steady_clock::now() - begin, chrono::milliseconds(30));
}

TEST(PersistWithRetryTest, RetriesStoreWrites) {
    fixtures::mock_result_store store;
    EXPECT_CALL(store, save(_))
        .Times(2)
        .WillOnce(Throw(persistence_error("down")))
        .WillOnce(Return());

    submission_result result = make_result("1", verdict::PASS);
    EXPECT_TRUE(store::persist_with_retry([&] { store.save(result); }, 3, chrono::milliseconds(1), "result"));
}
