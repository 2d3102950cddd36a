#include "sleepfile/merkle_tree.hpp"
#include "sleepfile/errors.hpp"
#include "sleepfile/flat_tree.hpp"

#include <new>
#include <stdexcept>
#include <string>
#include <utility>

namespace sleepfile {

MerkleTree::MerkleTree(NodeHasher hasher) : hasher_(std::move(hasher)) {
  if (!hasher_) {
    hasher_ = hashParent;
  }
}

void MerkleTree::reserveSlot(uint64_t index) {
  if (index < nodes_.size()) {
    return;
  }
  if (index >= nodes_.max_size()) {
    throw SleepError::atIndex(ErrorCode::InvalidIndex, index,
                              "index exceeds tree capacity");
  }
  try {
    nodes_.resize(index + 1);
  } catch (const std::bad_alloc &) {
    throw SleepError::atIndex(ErrorCode::InvalidIndex, index,
                              "no memory for tree of this size");
  } catch (const std::length_error &) {
    throw SleepError::atIndex(ErrorCode::InvalidIndex, index,
                              "index exceeds tree capacity");
  }
}

void MerkleTree::put(uint64_t index, const Entry &entry) {
  reserveSlot(index);
  if (!nodes_[index]) {
    ++entryCount_;
  }
  nodes_[index] = entry;
}

bool MerkleTree::has(uint64_t index) const {
  return index < nodes_.size() && nodes_[index].has_value();
}

const Entry &MerkleTree::get(uint64_t index) const {
  if (!has(index)) {
    throw SleepError::atIndex(ErrorCode::IncompleteTree, index,
                              "node not present");
  }
  return *nodes_[index];
}

std::vector<uint64_t> MerkleTree::appendLeaf(const DigestArray &hash,
                                             uint64_t byteLength) {
  Entry leaf{hash, byteLength};
  if (leaf.isBlank()) {
    throw SleepError(ErrorCode::BlankEntry,
                     "leaf with zero hash and zero length");
  }
  std::vector<uint64_t> written;
  uint64_t node = flat_tree::leafIndex(leafCount_);
  put(node, leaf);
  written.push_back(node);
  ++leafCount_;

  // Odd offset means node is a right child, so its parent may be complete.
  while (flat_tree::offset(node) & 1) {
    uint64_t left = flat_tree::sibling(node);
    if (!has(left)) {
      break;
    }
    const Entry &l = get(left);
    const Entry &r = get(node);
    uint64_t up = flat_tree::parent(node);
    put(up, Entry{hasher_(l.hash, r.hash), l.byteLength + r.byteLength});
    written.push_back(up);
    node = up;
  }
  return written;
}

std::vector<uint64_t> MerkleTree::appendData(std::span<const uint8_t> block) {
  return appendLeaf(blake2b(block), block.size());
}

void MerkleTree::insert(uint64_t index, const Entry &entry) {
  // Validates the index range.
  flat_tree::depth(index);
  if (entry.isBlank()) {
    throw SleepError::atIndex(ErrorCode::BlankEntry, index,
                              "blank entry marks an empty slot");
  }
  put(index, entry);
  if (flat_tree::isLeaf(index) && flat_tree::blockIndex(index) >= leafCount_) {
    leafCount_ = flat_tree::blockIndex(index) + 1;
  }
}

uint64_t MerkleTree::byteLength() const {
  uint64_t total = 0;
  for (uint64_t root : roots()) {
    total += get(root).byteLength;
  }
  return total;
}

void MerkleTree::validateSubtree(uint64_t root) const {
  if (flat_tree::depth(root) == 0) {
    get(root);
    return;
  }
  auto [left, right] = flat_tree::children(root);
  validateSubtree(left);
  validateSubtree(right);

  const Entry &stored = get(root);
  const Entry &l = get(left);
  const Entry &r = get(right);
  if (hasher_(l.hash, r.hash) != stored.hash) {
    throw SleepError::atIndex(ErrorCode::HashMismatch, root,
                              "stored hash differs from hash of children");
  }
  if (l.byteLength + r.byteLength != stored.byteLength) {
    throw SleepError::atIndex(ErrorCode::HashMismatch, root,
                              "stored byte length " +
                                  std::to_string(stored.byteLength) +
                                  " differs from children total " +
                                  std::to_string(l.byteLength + r.byteLength));
  }
}

void MerkleTree::validate() const {
  for (uint64_t root : roots()) {
    validateSubtree(root);
  }
}

std::vector<uint64_t> MerkleTree::rootsForLeafCount(uint64_t n) {
  return flat_tree::fullRoots(n);
}

uint64_t MerkleTree::rootForLeafCount(uint64_t n) {
  std::vector<uint64_t> roots = flat_tree::fullRoots(n);
  if (roots.size() != 1) {
    throw SleepError(ErrorCode::NoSingleRoot,
                     std::to_string(n) + " leaves form " +
                         std::to_string(roots.size()) + " full roots");
  }
  return roots.front();
}

MerkleProof MerkleTree::proof(uint64_t block) const {
  uint64_t leaf = flat_tree::leafIndex(block);
  if (block >= leafCount_) {
    throw SleepError::atIndex(ErrorCode::InvalidIndex, leaf,
                              "block beyond end of tree");
  }

  MerkleProof p;
  p.block = block;
  p.leaf = get(leaf);
  for (uint64_t root : roots()) {
    auto [first, last] = flat_tree::spanningLeafRange(root);
    if (leaf >= first && leaf <= last) {
      p.root = root;
      break;
    }
  }

  uint64_t node = leaf;
  while (node != p.root) {
    uint64_t sib = flat_tree::sibling(node);
    p.siblings.push_back({sib, get(sib)});
    node = flat_tree::parent(node);
  }
  return p;
}

bool MerkleTree::verifyProof(const MerkleProof &proof,
                             const DigestArray &rootHash,
                             const NodeHasher &hasher) {
  uint64_t node = flat_tree::leafIndex(proof.block);
  DigestArray hash = proof.leaf.hash;
  for (const auto &sib : proof.siblings) {
    if (sib.index != flat_tree::sibling(node)) {
      return false;
    }
    hash = sib.index < node ? hasher(sib.entry.hash, hash)
                            : hasher(hash, sib.entry.hash);
    node = flat_tree::parent(node);
  }
  return node == proof.root && hash == rootHash;
}

} // namespace sleepfile
