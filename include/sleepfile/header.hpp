#ifndef SLEEPFILE_HEADER_HPP
#define SLEEPFILE_HEADER_HPP

#include "sleepfile/digest.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace sleepfile {

/// Size of every SLEEP header.
inline constexpr size_t HEADER_SIZE = 32;

/// Magic bytes at offset 0.
inline constexpr std::array<uint8_t, 3> HEADER_MAGIC = {0x05, 0x02, 0x57};

/// Kind of SLEEP file, stored as the byte at offset 3.
enum class FileType : uint8_t { BitField = 0, Signatures = 1, Tree = 2 };

/// SLEEP format revision, stored as the byte at offset 4.
enum class Version : uint8_t { V0 = 0 };

/**
 * @brief Parsed representation of the 32-byte SLEEP header.
 *
 * Layout:
 * @code
 * offset 0   3 bytes  magic 05 02 57
 * offset 3   1 byte   file type
 * offset 4   1 byte   version
 * offset 5   2 bytes  entry size, big-endian
 * offset 7   1 byte   algorithm name length N
 * offset 8   N bytes  algorithm name
 * offset 8+N          zero padding up to offset 32
 * @endcode
 */
struct Header {
  FileType fileType{FileType::Tree};
  Version version{Version::V0};
  uint16_t entrySize{40};
  HashAlgorithm hashAlgorithm{HashAlgorithm::BLAKE2b};

  bool operator==(const Header &) const = default;
};

/// Conventional header for a file kind: 40-byte BLAKE2b entries for tree and
/// bitfield files, 64-byte Ed25519 entries for signatures files.
Header makeHeader(FileType type);

/// True when the entry size matches the file type and algorithm.
bool isConsistent(const Header &header);

/**
 * @brief Parse and validate a header.
 *
 * Checks run in byte order so the error names the first bad field:
 * length, magic, file type, version, algorithm name, padding, and finally
 * the entry size against the type and algorithm.
 *
 * @throw SleepError MalformedHeader, BadMagic, UnknownFileType,
 *        UnsupportedVersion, UnknownAlgorithm or CorruptPadding.
 */
Header parseHeader(std::span<const uint8_t> bytes);

/// Serialize a header. parseHeader(serializeHeader(h)) == h for valid h.
std::array<uint8_t, HEADER_SIZE> serializeHeader(const Header &header);

const char *toString(FileType type);

} // namespace sleepfile

#endif // SLEEPFILE_HEADER_HPP
