#include "sleepfile/merkle_tree.hpp"
#include "sleepfile/sleep_file.hpp"
#include "sleepfile/storage.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <vector>

using namespace sleepfile;

// Helper function to create a vector of bytes with random values
std::vector<uint8_t> create_random_byte_vector(size_t size) {
  std::vector<uint8_t> vec(size);
  std::generate(vec.begin(), vec.end(),
                []() { return static_cast<uint8_t>(std::rand() % 256); });
  return vec;
}

int main() {
  std::srand(static_cast<unsigned int>(std::time(nullptr)));

  const size_t total_size_bytes = 256ULL * 1024 * 1024; // 256 MiB
  const size_t block_size_bytes = 64 * 1024;           // 64 KiB
  const size_t num_blocks = total_size_bytes / block_size_bytes;

  std::vector<uint8_t> block = create_random_byte_vector(block_size_bytes);

  MemoryStorage storage;
  SleepFile file = SleepFile::create(storage, makeHeader(FileType::Tree));
  MerkleTree tree;

  auto start = std::chrono::high_resolution_clock::now();
  for (size_t i = 0; i < num_blocks; ++i) {
    block[i % block.size()] ^= 0x5a; // keep leaves distinct
    TreeFile::persist(tree, file, tree.appendData(block));
  }
  auto built = std::chrono::high_resolution_clock::now();
  tree.validate();
  auto validated = std::chrono::high_resolution_clock::now();

  std::chrono::duration<double> buildTime = built - start;
  std::chrono::duration<double> validateTime = validated - built;
  double mib = static_cast<double>(total_size_bytes) / (1024.0 * 1024.0);

  std::cout << "Blocks: " << num_blocks << ", entries: " << tree.entryCount()
            << std::endl;
  std::cout << "Build:    " << buildTime.count() << " s ("
            << mib / buildTime.count() << " MiB/s)" << std::endl;
  std::cout << "Validate: " << validateTime.count() << " s" << std::endl;
  return 0;
}
