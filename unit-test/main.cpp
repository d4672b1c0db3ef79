#include <glog/logging.h>
#include <filesystem>
#include "common/utils.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace fs = std::filesystem;

class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        run_dir = fs::temp_directory_path() / ("grader-test-" + grader::random_uuid());
        fs::create_directories(run_dir);
        grader::RUN_DIR = run_dir;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(run_dir, ec);
    }

private:
    fs::path run_dir;
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    ::testing::AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
