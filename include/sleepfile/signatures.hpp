#ifndef SLEEPFILE_SIGNATURES_HPP
#define SLEEPFILE_SIGNATURES_HPP

#include "sleepfile/digest.hpp"
#include "sleepfile/merkle_tree.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace sleepfile {

inline constexpr size_t PUBLIC_KEY_SIZE = 32;
inline constexpr size_t SECRET_KEY_SIZE = 64;

using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
using SecretKey = std::array<uint8_t, SECRET_KEY_SIZE>;

/// One full root as it takes part in the signed message.
struct RootNode {
  uint64_t index;
  Entry entry;
};

/// Current full roots of a tree with their entries.
std::vector<RootNode> collectRoots(const MerkleTree &tree);

/**
 * @brief Hash of a root set: BLAKE2b over hash || u64be(index) ||
 * u64be(byteLength) for each root, left to right.
 */
DigestArray hashRoots(const std::vector<RootNode> &roots);

/// Ed25519 detached signature over hashRoots(roots).
SignatureArray signRoots(const SecretKey &secretKey,
                         const std::vector<RootNode> &roots);

/// True when @p signature is valid for hashRoots(roots) under @p publicKey.
bool verifyRoots(const PublicKey &publicKey, const std::vector<RootNode> &roots,
                 const SignatureArray &signature);

} // namespace sleepfile

#endif // SLEEPFILE_SIGNATURES_HPP
