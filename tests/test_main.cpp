#include "taskforge/util/log.hpp"

#include <csignal>
#include <cstdlib>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  // sockets closed by the peer mid-write must not kill the test binary
  std::signal(SIGPIPE, SIG_IGN);

  if (const char *level = std::getenv("TASKFORGE_TEST_LOG_LEVEL")) {
    taskforge::log::set_level(std::string_view{level});
  } else {
    taskforge::log::set_level(taskforge::log::Level::Warn);
  }

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
