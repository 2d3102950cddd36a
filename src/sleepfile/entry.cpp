#include "sleepfile/entry.hpp"
#include "sleepfile/errors.hpp"

#include <algorithm>
#include <string>

namespace sleepfile {

bool Entry::isBlank() const {
  return byteLength == 0 &&
         std::all_of(hash.begin(), hash.end(), [](uint8_t b) { return b == 0; });
}

uint64_t readUint64BE(const uint8_t *p) {
  uint64_t value = 0;
  for (int i = 0; i < 8; ++i) {
    value = (value << 8) | p[i];
  }
  return value;
}

void writeUint64BE(uint64_t value, uint8_t *p) {
  for (int i = 7; i >= 0; --i) {
    p[i] = static_cast<uint8_t>(value & 0xff);
    value >>= 8;
  }
}

Entry parseEntry(std::span<const uint8_t> bytes, size_t entrySize) {
  if (entrySize != ENTRY_SIZE) {
    throw SleepError(ErrorCode::TruncatedEntry,
                     "entry size " + std::to_string(entrySize) +
                         " cannot hold a hash and length record");
  }
  if (bytes.size() != entrySize) {
    throw SleepError(ErrorCode::TruncatedEntry,
                     "expected " + std::to_string(entrySize) +
                         " bytes, got " + std::to_string(bytes.size()));
  }
  Entry e;
  std::copy(bytes.begin(), bytes.begin() + DIGEST_SIZE, e.hash.begin());
  e.byteLength = readUint64BE(bytes.data() + DIGEST_SIZE);
  return e;
}

std::array<uint8_t, ENTRY_SIZE> serializeEntry(const Entry &entry) {
  std::array<uint8_t, ENTRY_SIZE> out{};
  std::copy(entry.hash.begin(), entry.hash.end(), out.begin());
  writeUint64BE(entry.byteLength, out.data() + DIGEST_SIZE);
  return out;
}

SignatureArray parseSignature(std::span<const uint8_t> bytes) {
  if (bytes.size() != SIGNATURE_SIZE) {
    throw SleepError(ErrorCode::TruncatedEntry,
                     "expected a 64-byte signature, got " +
                         std::to_string(bytes.size()) + " bytes");
  }
  SignatureArray sig{};
  std::copy(bytes.begin(), bytes.end(), sig.begin());
  return sig;
}

EntryView::EntryView(std::span<const uint8_t> body, size_t entrySize)
    : body_(body), entrySize_(entrySize) {
  if (entrySize_ == 0 || body_.size() % entrySize_ != 0) {
    throw SleepError::atOffset(ErrorCode::MisalignedBody,
                               entrySize_ ? body_.size() - body_.size() % entrySize_
                                          : 0,
                               "body of " + std::to_string(body_.size()) +
                                   " bytes is not a multiple of entry size " +
                                   std::to_string(entrySize_));
  }
}

std::span<const uint8_t> EntryView::raw(size_t i) const {
  if (i >= size()) {
    throw SleepError::atIndex(ErrorCode::InvalidIndex, i,
                              "entry beyond end of body");
  }
  return body_.subspan(i * entrySize_, entrySize_);
}

Entry EntryView::at(size_t i) const { return parseEntry(raw(i), entrySize_); }

} // namespace sleepfile
