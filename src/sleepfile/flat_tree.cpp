#include "sleepfile/flat_tree.hpp"
#include "sleepfile/errors.hpp"

#include <bit>
#include <string>

namespace sleepfile::flat_tree {

namespace {

void checkIndex(uint64_t index) {
  if (index > MAX_INDEX) {
    throw SleepError::atIndex(ErrorCode::InvalidIndex, index,
                              "flat-tree index out of range");
  }
}

} // namespace

uint32_t depth(uint64_t index) {
  checkIndex(index);
  return static_cast<uint32_t>(std::countr_one(index));
}

uint64_t offset(uint64_t index) { return index >> (depth(index) + 1); }

uint64_t index(uint32_t depth, uint64_t offset) {
  if (depth > 62 || offset > (MAX_INDEX >> (depth + 1))) {
    throw SleepError(ErrorCode::InvalidIndex,
                     "depth " + std::to_string(depth) + " offset " +
                         std::to_string(offset) + " out of range");
  }
  return (offset << (depth + 1)) | ((uint64_t{1} << depth) - 1);
}

uint64_t parent(uint64_t index) {
  uint32_t d = depth(index);
  return flat_tree::index(d + 1, offset(index) >> 1);
}

uint64_t sibling(uint64_t index) {
  uint32_t d = depth(index);
  return flat_tree::index(d, offset(index) ^ 1);
}

std::pair<uint64_t, uint64_t> children(uint64_t index) {
  uint32_t d = depth(index);
  if (d == 0) {
    throw SleepError::atIndex(ErrorCode::LeafHasNoChildren, index,
                              "leaf node has no children");
  }
  uint64_t o = offset(index) * 2;
  return {flat_tree::index(d - 1, o), flat_tree::index(d - 1, o + 1)};
}

uint64_t leftChild(uint64_t index) { return children(index).first; }

uint64_t rightChild(uint64_t index) { return children(index).second; }

std::pair<uint64_t, uint64_t> spanningLeafRange(uint64_t index) {
  uint32_t d = depth(index);
  uint64_t half = (uint64_t{1} << d) - 1;
  return {index - half, index + half};
}

uint64_t leafIndex(uint64_t block) {
  if (block > (MAX_INDEX >> 1)) {
    throw SleepError::atIndex(ErrorCode::InvalidIndex, block,
                              "block number out of range");
  }
  return block * 2;
}

uint64_t blockIndex(uint64_t leaf) {
  checkIndex(leaf);
  if (!isLeaf(leaf)) {
    throw SleepError::atIndex(ErrorCode::InvalidIndex, leaf,
                              "not a leaf index");
  }
  return leaf / 2;
}

uint64_t leafCount(uint64_t index) { return uint64_t{1} << depth(index); }

std::vector<uint64_t> fullRoots(uint64_t leafCount) {
  if (leafCount > (MAX_INDEX >> 1) + 1) {
    throw SleepError(ErrorCode::InvalidIndex,
                     "leaf count " + std::to_string(leafCount) +
                         " out of range");
  }
  std::vector<uint64_t> roots;
  uint64_t remaining = leafCount;
  uint64_t base = 0;
  while (remaining) {
    uint64_t factor = std::bit_floor(remaining);
    roots.push_back(base + factor - 1);
    base += 2 * factor;
    remaining -= factor;
  }
  return roots;
}

} // namespace sleepfile::flat_tree
