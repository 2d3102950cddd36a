#include "sleepfile/digest.hpp"
#include "sleepfile/logger.h"
#include <filesystem>
#include <gtest/gtest.h>
#include <iostream>

int main(int argc, char **argv) {
  namespace fs = std::filesystem;
  fs::path base = fs::temp_directory_path() / "sleepfile_test_var";
  fs::create_directories(base);

  // Initialize the logger and libsodium for tests
  try {
    sleepfile::Logger::init((base / "sleepfile_tests.log").string(),
                            sleepfile::LogLevel::DEBUG);
    sleepfile::ensureSodium();
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Test initialization failed: " << e.what() << std::endl;
    return 1;
  }

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
