#ifndef SLEEPFILE_FLAT_TREE_HPP
#define SLEEPFILE_FLAT_TREE_HPP

#include <cstdint>
#include <utility>
#include <vector>

/**
 * @brief Index arithmetic for a binary tree laid out in one flat array.
 *
 * Nodes are numbered in order: leaves take the even positions and each
 * internal node sits between its two subtrees.
 * @code
 *       3
 *   1       5
 * 0   2   4   6
 * @endcode
 * A node's depth is the number of trailing one bits of its index and its
 * offset is its position among the nodes of that depth. Nothing is stored;
 * parent, sibling and children follow from (depth, offset).
 */
namespace sleepfile::flat_tree {

/// Indices at or above this bound are rejected with InvalidIndex so that
/// parent() and the span helpers never overflow.
inline constexpr uint64_t MAX_INDEX = (uint64_t{1} << 62) - 1;

uint32_t depth(uint64_t index);
uint64_t offset(uint64_t index);

/// Flat index of the node at (depth, offset).
uint64_t index(uint32_t depth, uint64_t offset);

uint64_t parent(uint64_t index);
uint64_t sibling(uint64_t index);

/// {left, right}. Throws LeafHasNoChildren for depth 0.
std::pair<uint64_t, uint64_t> children(uint64_t index);
uint64_t leftChild(uint64_t index);
uint64_t rightChild(uint64_t index);

/// Flat indices of the first and last leaf under a node, inclusive.
std::pair<uint64_t, uint64_t> spanningLeafRange(uint64_t index);

inline bool isLeaf(uint64_t index) { return (index & 1) == 0; }

/// Flat index of data block n, and back.
uint64_t leafIndex(uint64_t block);
uint64_t blockIndex(uint64_t leaf);

/// Number of data blocks under a node.
uint64_t leafCount(uint64_t index);

/**
 * @brief Roots of the maximal complete subtrees covering blocks [0, n).
 *
 * Ordered left to right. A power-of-two n yields one root; other counts
 * yield one root per set bit of n. n == 0 yields an empty list.
 */
std::vector<uint64_t> fullRoots(uint64_t leafCount);

} // namespace sleepfile::flat_tree

#endif // SLEEPFILE_FLAT_TREE_HPP
