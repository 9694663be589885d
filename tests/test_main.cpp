#include "ciforge/util/log.hpp"

#include <csignal>
#include <cstdlib>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  // Child processes of step tests may close pipes early.
  std::signal(SIGPIPE, SIG_IGN);

  const char *level = std::getenv("CIFORGE_TEST_LOG_LEVEL");
  ciforge::log::set_level(level ? level : "warn");

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
