#include "sleepfile/errors.hpp"
#include "sleepfile/logger.h"
#include "sleepfile/sleep_file.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) {
  sleepfile::Logger::init(sleepfile::Logger::CONSOLE_ONLY_OUTPUT,
                          sleepfile::LogLevel::FATAL);
  sleepfile::MemoryStorage storage(std::vector<uint8_t>(Data, Data + Size));
  try {
    sleepfile::SleepFile file = sleepfile::SleepFile::open(storage);
    sleepfile::MerkleTree tree = sleepfile::TreeFile::load(file);
    tree.validate();
    for (uint64_t block = 0; block < tree.leafCount() && block < 8; ++block) {
      tree.proof(block);
    }
  } catch (const sleepfile::SleepError &) {
  }
  return 0;
}
