#include "sleepfile/digest.hpp"
#include "sleepfile/errors.hpp"

#include <iomanip>
#include <sodium.h>
#include <sstream>
#include <string>

namespace sleepfile {

static_assert(crypto_generichash_BYTES == DIGEST_SIZE,
              "BLAKE2b default output must match the tree digest size");
static_assert(crypto_sign_BYTES == SIGNATURE_SIZE,
              "Ed25519 signature width mismatch");

namespace {

const AlgorithmTraits kBlake2b{HashAlgorithm::BLAKE2b, "BLAKE2b", DIGEST_SIZE,
                               40};
const AlgorithmTraits kEd25519{HashAlgorithm::Ed25519, "Ed25519",
                               SIGNATURE_SIZE, 64};

} // namespace

const AlgorithmTraits &traitsOf(HashAlgorithm algo) {
  return algo == HashAlgorithm::BLAKE2b ? kBlake2b : kEd25519;
}

const AlgorithmTraits *findAlgorithm(std::string_view name) {
  if (name == kBlake2b.name)
    return &kBlake2b;
  if (name == kEd25519.name)
    return &kEd25519;
  return nullptr;
}

void ensureSodium() {
  // sodium_init() returns 0 on success and 1 when already initialised.
  if (sodium_init() < 0) {
    throw SleepError(ErrorCode::Crypto, "Failed to initialize libsodium");
  }
}

DigestArray blake2b(std::span<const uint8_t> data) {
  ensureSodium();
  DigestArray out{};
  crypto_generichash(out.data(), out.size(), data.data(), data.size(),
                     nullptr, 0);
  return out;
}

DigestArray hashParent(const DigestArray &left, const DigestArray &right) {
  ensureSodium();
  crypto_generichash_state state;
  crypto_generichash_init(&state, nullptr, 0, DIGEST_SIZE);
  crypto_generichash_update(&state, left.data(), left.size());
  crypto_generichash_update(&state, right.data(), right.size());
  DigestArray out{};
  crypto_generichash_final(&state, out.data(), out.size());
  return out;
}

std::string toHex(std::span<const uint8_t> bytes) {
  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (uint8_t byte : bytes) {
    ss << std::setw(2) << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace sleepfile
