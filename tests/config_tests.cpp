#include "sleepfile/config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace sleepfile;

class ConfigTest : public ::testing::Test {
protected:
  std::filesystem::path path_ =
      std::filesystem::temp_directory_path() / "sleepfile_config_test.yaml";

  void SetUp() override {
    unsetenv("SLEEPFILE_LOG_LEVEL");
    unsetenv("SLEEPFILE_BLOCK_SIZE");
  }

  void TearDown() override {
    unsetenv("SLEEPFILE_LOG_LEVEL");
    unsetenv("SLEEPFILE_BLOCK_SIZE");
    std::filesystem::remove(path_);
  }

  void writeConfig(const std::string &text) {
    std::ofstream out(path_);
    out << text;
  }
};

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
  Options opts = loadOptions("/nonexistent/sleepfile_config.yaml");
  EXPECT_EQ(opts.logFile, Logger::CONSOLE_ONLY_OUTPUT);
  EXPECT_EQ(opts.logLevel, LogLevel::WARN);
  EXPECT_EQ(opts.blockSize, 64u * 1024u);
  EXPECT_TRUE(opts.verifyOnOpen);
}

TEST_F(ConfigTest, ReadsYamlValues) {
  writeConfig("log_file: /tmp/sleepfile.log\n"
              "log_level: debug\n"
              "block_size: 4096\n"
              "verify_on_open: false\n");
  Options opts = loadOptions(path_.string());
  EXPECT_EQ(opts.logFile, "/tmp/sleepfile.log");
  EXPECT_EQ(opts.logLevel, LogLevel::DEBUG);
  EXPECT_EQ(opts.blockSize, 4096u);
  EXPECT_FALSE(opts.verifyOnOpen);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
  writeConfig("log_level: info\nblock_size: 4096\n");
  setenv("SLEEPFILE_LOG_LEVEL", "error", 1);
  setenv("SLEEPFILE_BLOCK_SIZE", "1024", 1);
  Options opts = loadOptions(path_.string());
  EXPECT_EQ(opts.logLevel, LogLevel::ERROR);
  EXPECT_EQ(opts.blockSize, 1024u);
}

TEST_F(ConfigTest, RejectsBadValues) {
  writeConfig("block_size: [1, 2]\n");
  EXPECT_THROW(loadOptions(path_.string()), std::runtime_error);

  writeConfig("block_size: 0\n");
  EXPECT_THROW(loadOptions(path_.string()), std::runtime_error);

  writeConfig("log_level: info\n");
  setenv("SLEEPFILE_BLOCK_SIZE", "lots", 1);
  EXPECT_THROW(loadOptions(path_.string()), std::runtime_error);
}

TEST_F(ConfigTest, RejectsNegativeAndTrailingGarbageBlockSize) {
  setenv("SLEEPFILE_BLOCK_SIZE", "-1", 1);
  EXPECT_THROW(loadOptions(path_.string()), std::runtime_error);

  setenv("SLEEPFILE_BLOCK_SIZE", "12abc", 1);
  EXPECT_THROW(loadOptions(path_.string()), std::runtime_error);

  unsetenv("SLEEPFILE_BLOCK_SIZE");
  writeConfig("block_size: -4096\n");
  EXPECT_THROW(loadOptions(path_.string()), std::runtime_error);
}

TEST(ParseCount, AcceptsOnlyWholeNonNegativeNumbers) {
  EXPECT_EQ(parseCount("4096", "block size"), 4096u);
  EXPECT_EQ(parseCount(" 7 ", "block size"), 7u);
  EXPECT_THROW(parseCount("-1", "block size"), std::runtime_error);
  EXPECT_THROW(parseCount("12abc", "block size"), std::runtime_error);
  EXPECT_THROW(parseCount("[1, 2]", "block size"), std::runtime_error);
  EXPECT_THROW(parseCount("", "block size"), std::runtime_error);
}
