#ifndef SLEEPFILE_SLEEP_FILE_HPP
#define SLEEPFILE_SLEEP_FILE_HPP

#include "sleepfile/entry.hpp"
#include "sleepfile/header.hpp"
#include "sleepfile/merkle_tree.hpp"
#include "sleepfile/storage.hpp"

#include <cstdint>
#include <ostream>
#include <span>
#include <vector>

namespace sleepfile {

/**
 * @brief A SLEEP header bound to the storage that holds the file.
 *
 * Entry i lives at byte offset 32 + i * entrySize. The SleepFile does not
 * own the storage; the caller keeps it alive.
 */
class SleepFile {
public:
  /**
   * @brief Write a fresh header to empty storage.
   * @throw SleepError MalformedHeader if the header is inconsistent, Io if
   *        the storage already holds data.
   */
  static SleepFile create(ByteRangeProvider &storage, const Header &header);

  /**
   * @brief Read and validate the header of existing storage.
   * @throw SleepError any header error, or MisalignedBody when the body is
   *        not a whole number of entries.
   */
  static SleepFile open(ByteRangeProvider &storage);

  const Header &header() const { return header_; }

  uint64_t entryCount();

  std::vector<uint8_t> readRaw(uint64_t index);
  Entry readEntry(uint64_t index);
  SignatureArray readSignature(uint64_t index);

  /// Write entry @p index, zero-filling any skipped slots.
  /// @throw SleepError InvalidIndex if the entry's offset cannot be addressed.
  void writeEntry(uint64_t index, const Entry &entry);
  /// @return Index of the appended entry.
  uint64_t appendEntry(const Entry &entry);
  uint64_t appendSignature(const SignatureArray &signature);

  /// Whole body; wrap in an EntryView to iterate.
  std::vector<uint8_t> readBody();

private:
  SleepFile(ByteRangeProvider &storage, const Header &header);

  uint64_t entryOffset(uint64_t index) const;
  uint64_t appendRecord(std::span<const uint8_t> record);
  void requireEntrySize(size_t size) const;

  ByteRangeProvider *storage_;
  Header header_;
};

/// Print one line per entry: hex signatures for signatures files, length and
/// hash otherwise, plus the flat-tree depth for tree files.
void dumpEntries(SleepFile &file, std::ostream &out);

/// Loads and stores a MerkleTree in a tree SLEEP file.
class TreeFile {
public:
  /// Read every non-blank entry into a tree.
  /// @throw SleepError UnknownFileType if the file is not a tree file.
  static MerkleTree load(SleepFile &file, NodeHasher hasher = hashParent);

  /// Write the given flat indices of @p tree to the file.
  static void persist(const MerkleTree &tree, SleepFile &file,
                      const std::vector<uint64_t> &indices);

  /// Write every node of @p tree.
  static void persistAll(const MerkleTree &tree, SleepFile &file);
};

} // namespace sleepfile

#endif // SLEEPFILE_SLEEP_FILE_HPP
