#include <glog/logging.h>
#include <csignal>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/fixture.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    sandbox::test::setup_test_environment();
  }
  virtual void TearDown() {
    //  Stub
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  signal(SIGPIPE, SIG_IGN);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
