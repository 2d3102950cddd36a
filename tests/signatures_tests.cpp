#include "sleepfile/signatures.hpp"
#include <gtest/gtest.h>
#include <sodium.h>
#include <string>
#include <utility>

using namespace sleepfile;

namespace {

struct KeyPair {
  PublicKey pk{};
  SecretKey sk{};
};

KeyPair makeKeys() {
  KeyPair kp;
  crypto_sign_keypair(kp.pk.data(), kp.sk.data());
  return kp;
}

MerkleTree treeOf(int blocks) {
  MerkleTree tree;
  for (int i = 0; i < blocks; ++i) {
    std::string data(100 + i, static_cast<char>('a' + i));
    tree.appendData(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t *>(data.data()), data.size()));
  }
  return tree;
}

} // namespace

TEST(Signatures, CollectsCurrentRoots) {
  MerkleTree tree = treeOf(3);
  auto roots = collectRoots(tree);
  ASSERT_EQ(roots.size(), 2u);
  EXPECT_EQ(roots[0].index, 1u);
  EXPECT_EQ(roots[1].index, 4u);
  EXPECT_EQ(roots[0].entry, tree.get(1));
}

TEST(Signatures, SignAndVerifyRoots) {
  KeyPair kp = makeKeys();
  MerkleTree tree = treeOf(5);
  auto roots = collectRoots(tree);
  SignatureArray sig = signRoots(kp.sk, roots);
  EXPECT_TRUE(verifyRoots(kp.pk, roots, sig));

  SignatureArray tampered = sig;
  tampered[10] ^= 0x01;
  EXPECT_FALSE(verifyRoots(kp.pk, roots, tampered));

  KeyPair other = makeKeys();
  EXPECT_FALSE(verifyRoots(other.pk, roots, sig));
}

TEST(Signatures, SignatureCoversRootSet) {
  KeyPair kp = makeKeys();
  MerkleTree tree = treeOf(3);
  auto roots = collectRoots(tree);
  SignatureArray sig = signRoots(kp.sk, roots);

  auto grown = roots;
  grown[1].entry.byteLength += 1;
  EXPECT_FALSE(verifyRoots(kp.pk, grown, sig));

  MerkleTree bigger = treeOf(4);
  EXPECT_FALSE(verifyRoots(kp.pk, collectRoots(bigger), sig));
}

TEST(Signatures, RootHashIsOrderSensitive) {
  MerkleTree tree = treeOf(3);
  auto roots = collectRoots(tree);
  auto swapped = roots;
  std::swap(swapped[0], swapped[1]);
  EXPECT_NE(hashRoots(roots), hashRoots(swapped));
}
