#include <glog/logging.h>
#include <unistd.h>
#include <filesystem>
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // 测试可能以 root 运行，DEBUG 模式下 runguard 才允许以 root 运行选手程序
    grader::DEBUG = true;
    grader::RUNGUARD = RUNGUARD_PATH;
    grader::RUN_DIR = std::filesystem::temp_directory_path() / ("grader-test-" + std::to_string(getpid()));
    std::filesystem::create_directories(grader::RUN_DIR);
  }
  virtual void TearDown() {
    std::error_code ec;
    std::filesystem::remove_all(grader::RUN_DIR, ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
