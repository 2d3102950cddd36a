#ifndef SLEEPFILE_CONFIG_HPP
#define SLEEPFILE_CONFIG_HPP

#include "sleepfile/logger.h"

#include <cstdint>
#include <string>

namespace sleepfile {

/// Settings for the command line tool.
struct Options {
  std::string logFile = Logger::CONSOLE_ONLY_OUTPUT;
  LogLevel logLevel = LogLevel::WARN;
  uint64_t blockSize = 64 * 1024; ///< Chunk size used by `build`
  bool verifyOnOpen = true;       ///< Validate trees before printing them
};

/**
 * @brief Parse a non-negative decimal count such as a block size.
 * @throw std::runtime_error naming @p what for negative numbers, trailing
 *        characters or anything that is not a single scalar.
 */
uint64_t parseCount(const std::string &text, const std::string &what);

/**
 * @brief Load options from a YAML file, then apply environment overrides.
 *
 * Recognised keys: log_file, log_level, block_size, verify_on_open. A
 * missing file leaves the defaults in place. SLEEPFILE_LOG_LEVEL and
 * SLEEPFILE_BLOCK_SIZE override the file.
 *
 * @throw std::runtime_error if the file exists but cannot be parsed or a
 *        value has the wrong type.
 */
Options loadOptions(const std::string &path);

/// loadOptions() on $SLEEPFILE_CONFIG, or sleepfile_config.yaml.
Options loadDefaultOptions();

} // namespace sleepfile

#endif // SLEEPFILE_CONFIG_HPP
