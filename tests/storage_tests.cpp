#include "gtest/gtest.h"
#include "sleepfile/errors.hpp"
#include "sleepfile/storage.hpp"
#include <filesystem>
#include <limits>
#include <set>
#include <thread>
#include <vector>

using namespace sleepfile;

TEST(MemoryStorageTest, WriteAndRead) {
  MemoryStorage storage;
  std::vector<uint8_t> data = {1, 2, 3, 4};
  storage.append(data);
  EXPECT_EQ(storage.size(), 4u);
  EXPECT_EQ(storage.read(1, 2), std::vector<uint8_t>({2, 3}));
  EXPECT_TRUE(storage.read(4, 0).empty());
}

TEST(MemoryStorageTest, WritePastEndZeroFills) {
  MemoryStorage storage;
  std::vector<uint8_t> data = {9};
  storage.write(3, data);
  EXPECT_EQ(storage.bytes(), std::vector<uint8_t>({0, 0, 0, 9}));
  storage.write(1, data);
  EXPECT_EQ(storage.bytes(), std::vector<uint8_t>({0, 9, 0, 9}));
}

TEST(MemoryStorageTest, ReadPastEndFails) {
  MemoryStorage storage(std::vector<uint8_t>(10));
  try {
    storage.read(8, 4);
    FAIL() << "read past end succeeded";
  } catch (const SleepError &e) {
    EXPECT_EQ(e.code(), ErrorCode::Io);
    EXPECT_EQ(e.offset().value_or(0), 8u);
  }
  EXPECT_THROW(storage.read(11, 0), SleepError);
}

TEST(MemoryStorageTest, AppendReturnsOffset) {
  MemoryStorage storage;
  std::vector<uint8_t> data = {1, 2, 3};
  EXPECT_EQ(storage.append(data), 0u);
  EXPECT_EQ(storage.append(data), 3u);
  EXPECT_EQ(storage.size(), 6u);
}

TEST(MemoryStorageTest, ConcurrentAppendsDoNotOverlap) {
  MemoryStorage storage;
  const int threads = 8;
  const int perThread = 200;
  std::vector<std::vector<uint64_t>> offsets(threads);
  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([&storage, &offsets, t] {
      std::vector<uint8_t> record(4, static_cast<uint8_t>(t + 1));
      for (int i = 0; i < perThread; ++i) {
        offsets[t].push_back(storage.append(record));
      }
    });
  }
  for (auto &w : workers) {
    w.join();
  }
  EXPECT_EQ(storage.size(), uint64_t{threads * perThread * 4});

  std::set<uint64_t> seen;
  for (int t = 0; t < threads; ++t) {
    for (uint64_t offset : offsets[t]) {
      EXPECT_TRUE(seen.insert(offset).second) << "offset " << offset;
      EXPECT_EQ(offset % 4, 0u);
      // Every record is intact and belongs to the thread that appended it.
      EXPECT_EQ(storage.read(offset, 4),
                std::vector<uint8_t>(4, static_cast<uint8_t>(t + 1)));
    }
  }
}

TEST(MemoryStorageTest, WriteBeyondCapacityIsIoError) {
  MemoryStorage storage(std::vector<uint8_t>(8));
  std::vector<uint8_t> data = {1, 2, 3, 4};
  uint64_t offset = std::numeric_limits<uint64_t>::max() - 1;
  try {
    storage.write(offset, data);
    FAIL() << "write at the end of the offset range succeeded";
  } catch (const SleepError &e) {
    EXPECT_EQ(e.code(), ErrorCode::Io);
    EXPECT_EQ(e.offset().value_or(0), offset);
  }
  EXPECT_EQ(storage.size(), 8u);
}

TEST(FileStorageTest, PersistsAcrossInstances) {
  namespace fs = std::filesystem;
  fs::path path = fs::temp_directory_path() / "sleepfile_storage_test.bin";
  fs::remove(path);
  {
    FileStorage storage(path.string());
    EXPECT_EQ(storage.size(), 0u);
    std::vector<uint8_t> data = {0xde, 0xad};
    EXPECT_EQ(storage.append(data), 0u);
    storage.write(4, data);
    EXPECT_EQ(storage.append(data), 6u);
    EXPECT_EQ(storage.size(), 8u);
  }
  {
    FileStorage storage(path.string());
    EXPECT_EQ(storage.read(0, 8), std::vector<uint8_t>({0xde, 0xad, 0, 0, 0xde,
                                                        0xad, 0xde, 0xad}));
    EXPECT_THROW(storage.read(7, 2), SleepError);
  }
  fs::remove(path);
}
