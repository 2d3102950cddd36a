#include "sleepfile/config.hpp"
#include "sleepfile/errors.hpp"
#include "sleepfile/flat_tree.hpp"
#include "sleepfile/logger.h"
#include "sleepfile/merkle_tree.hpp"
#include "sleepfile/sleep_file.hpp"
#include "sleepfile/storage.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace sleepfile;

static int header_command(const std::string &path) {
  FileStorage storage(path);
  SleepFile file = SleepFile::open(storage);
  const Header &h = file.header();
  std::cout << "type\t" << toString(h.fileType) << std::endl;
  std::cout << "version\t" << static_cast<int>(h.version) << std::endl;
  std::cout << "entry_size\t" << h.entrySize << std::endl;
  std::cout << "algorithm\t" << traitsOf(h.hashAlgorithm).name << std::endl;
  std::cout << "entries\t" << file.entryCount() << std::endl;
  return 0;
}

static int dump_command(const std::string &path) {
  FileStorage storage(path);
  SleepFile file = SleepFile::open(storage);
  dumpEntries(file, std::cout);
  return 0;
}

static MerkleTree load_tree(const std::string &path, const Options &opts) {
  FileStorage storage(path);
  SleepFile file = SleepFile::open(storage);
  MerkleTree tree = TreeFile::load(file);
  if (opts.verifyOnOpen) {
    tree.validate();
  }
  return tree;
}

static int roots_command(const std::string &path, const Options &opts) {
  MerkleTree tree = load_tree(path, opts);
  std::cout << "leaves\t" << tree.leafCount() << std::endl;
  std::cout << "bytes\t" << tree.byteLength() << std::endl;
  for (uint64_t root : tree.roots()) {
    auto [first, last] = flat_tree::spanningLeafRange(root);
    std::cout << root << "\tblocks " << flat_tree::blockIndex(first) << "-"
              << flat_tree::blockIndex(last) << '\t'
              << toHex(tree.get(root).hash) << std::endl;
  }
  return 0;
}

static int verify_command(const std::string &path) {
  FileStorage storage(path);
  SleepFile file = SleepFile::open(storage);
  MerkleTree tree = TreeFile::load(file);
  tree.validate();
  std::cout << "Verification succeeded: " << tree.leafCount() << " blocks, "
            << tree.entryCount() << " entries" << std::endl;
  return 0;
}

static int build_command(const std::string &treePath,
                         const std::string &dataPath, uint64_t blockSize) {
  std::ifstream in(dataPath, std::ios::binary);
  if (!in.is_open()) {
    std::cerr << "Could not open data file: " << dataPath << std::endl;
    return 1;
  }
  if (std::filesystem::exists(treePath) &&
      std::filesystem::file_size(treePath) > 0) {
    std::cerr << "Tree file already exists: " << treePath << std::endl;
    return 1;
  }
  FileStorage storage(treePath);
  SleepFile file = SleepFile::create(storage, makeHeader(FileType::Tree));
  MerkleTree tree;
  std::vector<uint8_t> block(blockSize);
  while (in) {
    in.read(reinterpret_cast<char *>(block.data()),
            static_cast<std::streamsize>(block.size()));
    std::streamsize got = in.gcount();
    if (got <= 0)
      break;
    auto written = tree.appendData(
        std::span<const uint8_t>(block.data(), static_cast<size_t>(got)));
    TreeFile::persist(tree, file, written);
  }
  Logger::getInstance().log(LogLevel::INFO,
                            "Built " + treePath + " from " + dataPath);
  std::cout << "Wrote " << tree.leafCount() << " blocks, "
            << tree.entryCount() << " entries" << std::endl;
  return 0;
}

static int proof_command(const std::string &path, uint64_t block,
                         const Options &opts) {
  MerkleTree tree = load_tree(path, opts);
  MerkleProof p = tree.proof(block);
  std::cout << "leaf\t" << flat_tree::leafIndex(block) << '\t'
            << toHex(p.leaf.hash) << std::endl;
  for (const auto &sib : p.siblings) {
    std::cout << "sibling\t" << sib.index << '\t' << toHex(sib.entry.hash)
              << std::endl;
  }
  std::cout << "root\t" << p.root << '\t' << toHex(tree.get(p.root).hash)
            << std::endl;
  bool ok = MerkleTree::verifyProof(p, tree.get(p.root).hash);
  std::cout << (ok ? "Proof verified" : "Proof FAILED") << std::endl;
  return ok ? 0 : 1;
}

static void usage() {
  std::cout << "Usage: sleepfile_ctl header <file>\n"
            << "       sleepfile_ctl dump <file>\n"
            << "       sleepfile_ctl roots <tree-file>\n"
            << "       sleepfile_ctl verify <tree-file>\n"
            << "       sleepfile_ctl build <tree-file> <data-file> "
               "[block-size]\n"
            << "       sleepfile_ctl proof <tree-file> <block>\n";
}

int main(int argc, char **argv) {
  if (argc < 3) {
    usage();
    return 1;
  }

  Options opts;
  try {
    opts = loadDefaultOptions();
    Logger::init(opts.logFile, opts.logLevel);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }

  std::string cmd = argv[1];
  std::string path = argv[2];
  try {
    if (cmd == "header") {
      return header_command(path);
    } else if (cmd == "dump") {
      return dump_command(path);
    } else if (cmd == "roots") {
      return roots_command(path, opts);
    } else if (cmd == "verify") {
      return verify_command(path);
    } else if (cmd == "build" && argc >= 4) {
      uint64_t blockSize =
          argc >= 5 ? parseCount(argv[4], "block size") : opts.blockSize;
      if (blockSize == 0) {
        std::cerr << "Block size must be positive" << std::endl;
        return 1;
      }
      return build_command(path, argv[3], blockSize);
    } else if (cmd == "proof" && argc >= 4) {
      std::string arg = argv[3];
      if (!arg.empty() && arg[0] == '-') {
        throw SleepError(ErrorCode::InvalidIndex,
                         "negative block number " + arg);
      }
      return proof_command(path, parseCount(arg, "block number"), opts);
    }
  } catch (const SleepError &e) {
    Logger::getInstance().log(LogLevel::ERROR, e.what());
    std::cerr << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  usage();
  return 1;
}
