#ifndef SLEEPFILE_MERKLE_TREE_HPP
#define SLEEPFILE_MERKLE_TREE_HPP

#include "sleepfile/digest.hpp"
#include "sleepfile/entry.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace sleepfile {

/// Combines two child hashes into their parent's hash.
using NodeHasher =
    std::function<DigestArray(const DigestArray &left, const DigestArray &right)>;

/**
 * @brief Inclusion proof of one data block up to the full root containing it.
 */
struct MerkleProof {
  struct Node {
    uint64_t index;
    Entry entry;
  };

  uint64_t block{0};
  Entry leaf;
  std::vector<Node> siblings; ///< Leaf-to-root order
  uint64_t root{0};           ///< Flat index of the full root
};

/**
 * @brief Append-only Merkle tree addressed by flat-tree index.
 *
 * Entries live in a vector indexed by flat position; a slot is empty until
 * its node has been written. Parents are computed eagerly as soon as both
 * children exist. An all-zero entry is how tree files mark an empty slot, so
 * a leaf with a zero hash and zero length cannot be stored. A tree has a
 * single writer; const members may be called concurrently against an
 * unchanging tree.
 */
class MerkleTree {
public:
  explicit MerkleTree(NodeHasher hasher = hashParent);

  /**
   * @brief Append a leaf for the next data block.
   *
   * Writes the leaf at flat index 2 * leafCount() and then every ancestor
   * that became complete, stopping at the first ancestor whose other
   * subtree is not present yet.
   *
   * @return Flat indices written, leaf first.
   * @throw SleepError BlankEntry for a zero hash with zero length.
   */
  std::vector<uint64_t> appendLeaf(const DigestArray &hash, uint64_t byteLength);

  /// Hash a data block with BLAKE2b and append it as a leaf.
  std::vector<uint64_t> appendData(std::span<const uint8_t> block);

  /// Place a stored entry at a flat index. Used when loading a tree file.
  /// @throw SleepError InvalidIndex if the slot cannot be allocated,
  ///        BlankEntry for an all-zero entry.
  void insert(uint64_t index, const Entry &entry);

  bool has(uint64_t index) const;

  /// @throw SleepError IncompleteTree when the slot is empty.
  const Entry &get(uint64_t index) const;

  /// Number of data blocks.
  uint64_t leafCount() const { return leafCount_; }
  /// Number of written entries, leaves and parents.
  uint64_t entryCount() const { return entryCount_; }
  /// One past the highest flat index ever written.
  uint64_t size() const { return nodes_.size(); }
  /// Total byte length of all data blocks.
  uint64_t byteLength() const;

  /**
   * @brief Recompute the subtree under @p root from its leaves and compare.
   *
   * Children are checked before their parent, left before right. The first
   * divergence stops the walk.
   *
   * @throw SleepError HashMismatch at the first node whose stored hash or
   *        byte length disagrees with its children.
   * @throw SleepError IncompleteTree when a required node is missing.
   */
  void validateSubtree(uint64_t root) const;

  /// Validate every full root of the current leaf count.
  void validate() const;

  /// Current full roots, left to right.
  std::vector<uint64_t> roots() const { return rootsForLeafCount(leafCount_); }

  /// Full roots covering blocks [0, n), left to right.
  static std::vector<uint64_t> rootsForLeafCount(uint64_t n);

  /// The single node spanning blocks [0, n).
  /// @throw SleepError NoSingleRoot when n is not a power of two.
  static uint64_t rootForLeafCount(uint64_t n);

  /// Build an inclusion proof for a data block.
  MerkleProof proof(uint64_t block) const;

  /// Check a proof against the expected hash of its root.
  static bool verifyProof(const MerkleProof &proof, const DigestArray &rootHash,
                          const NodeHasher &hasher = hashParent);

private:
  void reserveSlot(uint64_t index);
  void put(uint64_t index, const Entry &entry);

  NodeHasher hasher_;
  std::vector<std::optional<Entry>> nodes_;
  uint64_t leafCount_{0};
  uint64_t entryCount_{0};
};

} // namespace sleepfile

#endif // SLEEPFILE_MERKLE_TREE_HPP
