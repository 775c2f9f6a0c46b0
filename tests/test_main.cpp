#include "caprouter/util/log.hpp"

#include <csignal>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  std::signal(SIGPIPE, SIG_IGN);

  // Breaker and retry paths log warnings on every failure.
  caprouter::log::set_output_stderr();
  caprouter::log::set_level(caprouter::log::Level::Error);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
