#include "sleepfile/header.hpp"
#include "sleepfile/errors.hpp"

#include <algorithm>
#include <string>
#include <string_view>

namespace sleepfile {

namespace {

constexpr size_t kTypeOffset = 3;
constexpr size_t kVersionOffset = 4;
constexpr size_t kEntrySizeOffset = 5;
constexpr size_t kNameLengthOffset = 7;
constexpr size_t kNameOffset = 8;
constexpr size_t kMaxNameLength = HEADER_SIZE - kNameOffset;

} // namespace

Header makeHeader(FileType type) {
  Header h;
  h.fileType = type;
  h.version = Version::V0;
  h.hashAlgorithm = type == FileType::Signatures ? HashAlgorithm::Ed25519
                                                 : HashAlgorithm::BLAKE2b;
  h.entrySize = traitsOf(h.hashAlgorithm).entrySize;
  return h;
}

bool isConsistent(const Header &header) {
  if (header.fileType == FileType::Signatures) {
    return header.hashAlgorithm == HashAlgorithm::Ed25519 &&
           header.entrySize == traitsOf(HashAlgorithm::Ed25519).entrySize;
  }
  return header.hashAlgorithm == HashAlgorithm::BLAKE2b &&
         header.entrySize == traitsOf(HashAlgorithm::BLAKE2b).entrySize;
}

Header parseHeader(std::span<const uint8_t> bytes) {
  if (bytes.size() != HEADER_SIZE) {
    throw SleepError(ErrorCode::MalformedHeader,
                     "header must be exactly 32 bytes, got " +
                         std::to_string(bytes.size()));
  }
  for (size_t i = 0; i < HEADER_MAGIC.size(); ++i) {
    if (bytes[i] != HEADER_MAGIC[i]) {
      throw SleepError::atOffset(ErrorCode::BadMagic, i,
                                 "expected magic 05 02 57");
    }
  }

  Header h;
  uint8_t type = bytes[kTypeOffset];
  if (type > static_cast<uint8_t>(FileType::Tree)) {
    throw SleepError::atOffset(ErrorCode::UnknownFileType, kTypeOffset,
                               "file type byte " + std::to_string(type));
  }
  h.fileType = static_cast<FileType>(type);

  uint8_t version = bytes[kVersionOffset];
  if (version != static_cast<uint8_t>(Version::V0)) {
    throw SleepError::atOffset(ErrorCode::UnsupportedVersion, kVersionOffset,
                               "version " + std::to_string(version));
  }
  h.version = Version::V0;

  h.entrySize = static_cast<uint16_t>((bytes[kEntrySizeOffset] << 8) |
                                      bytes[kEntrySizeOffset + 1]);

  size_t nameLength = bytes[kNameLengthOffset];
  if (nameLength > kMaxNameLength) {
    throw SleepError::atOffset(ErrorCode::MalformedHeader, kNameLengthOffset,
                               "algorithm name length " +
                                   std::to_string(nameLength) +
                                   " runs past the header");
  }
  std::string_view name(reinterpret_cast<const char *>(bytes.data()) +
                            kNameOffset,
                        nameLength);
  const AlgorithmTraits *traits = findAlgorithm(name);
  if (!traits) {
    throw SleepError::atOffset(ErrorCode::UnknownAlgorithm, kNameOffset,
                               "algorithm '" + std::string(name) + "'");
  }
  h.hashAlgorithm = traits->algorithm;

  for (size_t i = kNameOffset + nameLength; i < HEADER_SIZE; ++i) {
    if (bytes[i] != 0) {
      throw SleepError::atOffset(ErrorCode::CorruptPadding, i,
                                 "non-zero padding byte");
    }
  }

  if (!isConsistent(h)) {
    throw SleepError::atOffset(
        ErrorCode::MalformedHeader, kEntrySizeOffset,
        "entry size " + std::to_string(h.entrySize) + " does not fit a " +
            toString(h.fileType) + " file using " + std::string(traits->name));
  }
  return h;
}

std::array<uint8_t, HEADER_SIZE> serializeHeader(const Header &header) {
  std::array<uint8_t, HEADER_SIZE> out{};
  std::copy(HEADER_MAGIC.begin(), HEADER_MAGIC.end(), out.begin());
  out[kTypeOffset] = static_cast<uint8_t>(header.fileType);
  out[kVersionOffset] = static_cast<uint8_t>(header.version);
  out[kEntrySizeOffset] = static_cast<uint8_t>(header.entrySize >> 8);
  out[kEntrySizeOffset + 1] = static_cast<uint8_t>(header.entrySize & 0xff);
  std::string_view name = traitsOf(header.hashAlgorithm).name;
  out[kNameLengthOffset] = static_cast<uint8_t>(name.size());
  std::copy(name.begin(), name.end(), out.begin() + kNameOffset);
  return out;
}

const char *toString(FileType type) {
  switch (type) {
  case FileType::BitField:
    return "BitField";
  case FileType::Signatures:
    return "Signatures";
  case FileType::Tree:
    return "Tree";
  default:
    return "Unknown";
  }
}

} // namespace sleepfile
