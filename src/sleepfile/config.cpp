#include "sleepfile/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace sleepfile {

uint64_t parseCount(const std::string &text, const std::string &what) {
  YAML::Node node;
  try {
    node = YAML::Load(text);
    if (node.IsScalar()) {
      return node.as<uint64_t>();
    }
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Invalid " + what + " '" + text + "': " +
                             e.what());
  }
  throw std::runtime_error("Invalid " + what + " '" + text +
                           "': not a single number");
}

Options loadOptions(const std::string &path) {
  Options opts;
  if (std::filesystem::exists(path)) {
    try {
      YAML::Node node = YAML::LoadFile(path);
      if (node["log_file"])
        opts.logFile = node["log_file"].as<std::string>();
      if (node["log_level"])
        opts.logLevel =
            parseLogLevel(node["log_level"].as<std::string>(), opts.logLevel);
      if (node["block_size"])
        opts.blockSize = node["block_size"].as<uint64_t>();
      if (node["verify_on_open"])
        opts.verifyOnOpen = node["verify_on_open"].as<bool>();
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("Invalid config " + path + ": " + e.what());
    }
  }
  if (const char *env = std::getenv("SLEEPFILE_LOG_LEVEL"))
    opts.logLevel = parseLogLevel(env, opts.logLevel);
  if (const char *env = std::getenv("SLEEPFILE_BLOCK_SIZE"))
    opts.blockSize = parseCount(env, "SLEEPFILE_BLOCK_SIZE");
  if (opts.blockSize == 0) {
    throw std::runtime_error("block_size must be positive");
  }
  return opts;
}

Options loadDefaultOptions() {
  const char *cfg = std::getenv("SLEEPFILE_CONFIG");
  if (!cfg)
    cfg = "sleepfile_config.yaml";
  return loadOptions(cfg);
}

} // namespace sleepfile
