#include "sleepfile/signatures.hpp"

#include <sodium.h>

namespace sleepfile {

static_assert(crypto_sign_PUBLICKEYBYTES == PUBLIC_KEY_SIZE,
              "Ed25519 public key width mismatch");
static_assert(crypto_sign_SECRETKEYBYTES == SECRET_KEY_SIZE,
              "Ed25519 secret key width mismatch");

std::vector<RootNode> collectRoots(const MerkleTree &tree) {
  std::vector<RootNode> roots;
  for (uint64_t index : tree.roots()) {
    roots.push_back({index, tree.get(index)});
  }
  return roots;
}

DigestArray hashRoots(const std::vector<RootNode> &roots) {
  std::vector<uint8_t> message;
  message.reserve(roots.size() * (DIGEST_SIZE + 16));
  for (const auto &root : roots) {
    message.insert(message.end(), root.entry.hash.begin(),
                   root.entry.hash.end());
    uint8_t buf[16];
    writeUint64BE(root.index, buf);
    writeUint64BE(root.entry.byteLength, buf + 8);
    message.insert(message.end(), buf, buf + sizeof(buf));
  }
  return blake2b(message);
}

SignatureArray signRoots(const SecretKey &secretKey,
                         const std::vector<RootNode> &roots) {
  ensureSodium();
  DigestArray digest = hashRoots(roots);
  SignatureArray sig{};
  crypto_sign_detached(sig.data(), nullptr, digest.data(), digest.size(),
                       secretKey.data());
  return sig;
}

bool verifyRoots(const PublicKey &publicKey, const std::vector<RootNode> &roots,
                 const SignatureArray &signature) {
  ensureSodium();
  DigestArray digest = hashRoots(roots);
  return crypto_sign_verify_detached(signature.data(), digest.data(),
                                     digest.size(), publicKey.data()) == 0;
}

} // namespace sleepfile
