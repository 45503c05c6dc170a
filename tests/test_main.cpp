/// Shared test entry point. Silences the application logger unless
/// DDNS_TEST_LOG_LEVEL asks for output, and shuts spdlog down explicitly
/// before exit to sidestep static destruction order issues with the spdlog
/// shared library.

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

#include <unistd.h>

#include "common/Logger.hpp"

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);

  const char* pLevel = std::getenv("DDNS_TEST_LOG_LEVEL");
  ddns::common::Logger::init(pLevel ? std::string(pLevel) : std::string("off"));

  int iResult = RUN_ALL_TESTS();

  spdlog::drop_all();
  spdlog::shutdown();

  // All results are printed; skip static destructors and keep the exit code.
  _exit(iResult);
}
