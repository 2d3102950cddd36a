#include <gtest/gtest.h>
#include "sleepfile/errors.hpp"
#include "sleepfile/merkle_tree.hpp"
#include <string>

using namespace sleepfile;

namespace {

MerkleTree buildTree(int blocks) {
  MerkleTree tree;
  for (int i = 0; i < blocks; ++i) {
    std::string data = "block-" + std::to_string(i);
    tree.appendData(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t *>(data.data()), data.size()));
  }
  return tree;
}

} // namespace

TEST(MerkleProof, VerifiesEveryBlockOfFullTree) {
  MerkleTree tree = buildTree(8);
  for (uint64_t block = 0; block < 8; ++block) {
    MerkleProof p = tree.proof(block);
    EXPECT_EQ(p.root, 7u);
    EXPECT_EQ(p.siblings.size(), 3u);
    EXPECT_TRUE(MerkleTree::verifyProof(p, tree.get(7).hash))
        << "block " << block;
  }
}

TEST(MerkleProof, UsesContainingRootOfForest) {
  MerkleTree tree = buildTree(5);
  MerkleProof first = tree.proof(2);
  EXPECT_EQ(first.root, 3u);
  EXPECT_TRUE(MerkleTree::verifyProof(first, tree.get(3).hash));

  MerkleProof last = tree.proof(4);
  EXPECT_EQ(last.root, 8u);
  EXPECT_TRUE(last.siblings.empty());
  EXPECT_TRUE(MerkleTree::verifyProof(last, tree.get(8).hash));
}

TEST(MerkleProof, RejectsTamperedProof) {
  MerkleTree tree = buildTree(4);
  MerkleProof p = tree.proof(1);
  DigestArray root = tree.get(3).hash;

  MerkleProof badSibling = p;
  badSibling.siblings[0].entry.hash[0] ^= 0x01;
  EXPECT_FALSE(MerkleTree::verifyProof(badSibling, root));

  MerkleProof badLeaf = p;
  badLeaf.leaf.hash[31] ^= 0x80;
  EXPECT_FALSE(MerkleTree::verifyProof(badLeaf, root));

  MerkleProof wrongIndex = p;
  wrongIndex.siblings[0].index = 6;
  EXPECT_FALSE(MerkleTree::verifyProof(wrongIndex, root));

  EXPECT_FALSE(MerkleTree::verifyProof(p, tree.get(1).hash));
}

TEST(MerkleProof, BlockBeyondTree) {
  MerkleTree tree = buildTree(3);
  try {
    tree.proof(3);
    FAIL() << "proof built for missing block";
  } catch (const SleepError &e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidIndex);
  }
}
