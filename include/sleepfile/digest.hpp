#ifndef SLEEPFILE_DIGEST_HPP
#define SLEEPFILE_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace sleepfile {

/// Algorithms a SLEEP header can name.
enum class HashAlgorithm { BLAKE2b, Ed25519 };

/// Digest size of the tree hash (BLAKE2b-256).
inline constexpr size_t DIGEST_SIZE = 32;
/// Width of an Ed25519 detached signature.
inline constexpr size_t SIGNATURE_SIZE = 64;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;
using SignatureArray = std::array<uint8_t, SIGNATURE_SIZE>;

/**
 * @brief Fixed properties of a header algorithm.
 *
 * BLAKE2b produces the 32-byte node hashes of tree and bitfield files, whose
 * entries are hash plus an 8-byte length. Ed25519 produces the 64-byte
 * signatures stored one per entry in signatures files.
 */
struct AlgorithmTraits {
  HashAlgorithm algorithm;
  std::string_view name;
  size_t outputSize;
  uint16_t entrySize;
};

const AlgorithmTraits &traitsOf(HashAlgorithm algo);

/// Look up an algorithm by its header name. Returns nullptr when unknown.
const AlgorithmTraits *findAlgorithm(std::string_view name);

/// Initialise libsodium. Throws SleepError(Crypto) on failure.
void ensureSodium();

/// BLAKE2b-256 of a byte range.
DigestArray blake2b(std::span<const uint8_t> data);

/// BLAKE2b-256 of left || right, the default parent combination.
DigestArray hashParent(const DigestArray &left, const DigestArray &right);

/// Lowercase hex rendering, used by the CLI and diagnostics.
std::string toHex(std::span<const uint8_t> bytes);

} // namespace sleepfile

#endif // SLEEPFILE_DIGEST_HPP
