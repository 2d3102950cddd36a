#include "sleepfile/sleep_file.hpp"
#include "sleepfile/errors.hpp"
#include "sleepfile/flat_tree.hpp"
#include "sleepfile/logger.h"

#include <limits>
#include <ostream>
#include <string>
#include <utility>

namespace sleepfile {

SleepFile::SleepFile(ByteRangeProvider &storage, const Header &header)
    : storage_(&storage), header_(header) {}

SleepFile SleepFile::create(ByteRangeProvider &storage, const Header &header) {
  if (!isConsistent(header)) {
    throw SleepError(ErrorCode::MalformedHeader,
                     "entry size " + std::to_string(header.entrySize) +
                         " does not fit a " + toString(header.fileType) +
                         " file");
  }
  if (storage.size() != 0) {
    throw SleepError(ErrorCode::Io, "refusing to create over existing data");
  }
  auto bytes = serializeHeader(header);
  storage.append(bytes);
  Logger::getInstance().log(LogLevel::DEBUG,
                            std::string("Created ") +
                                toString(header.fileType) + " file");
  return SleepFile(storage, header);
}

SleepFile SleepFile::open(ByteRangeProvider &storage) {
  uint64_t total = storage.size();
  if (total < HEADER_SIZE) {
    throw SleepError(ErrorCode::MalformedHeader,
                     "file of " + std::to_string(total) +
                         " bytes is shorter than a header");
  }
  std::vector<uint8_t> raw = storage.read(0, HEADER_SIZE);
  Header header = parseHeader(raw);
  uint64_t body = total - HEADER_SIZE;
  if (body % header.entrySize != 0) {
    throw SleepError::atOffset(ErrorCode::MisalignedBody,
                               total - body % header.entrySize,
                               "trailing partial entry of " +
                                   std::to_string(body % header.entrySize) +
                                   " bytes");
  }
  Logger::getInstance().log(LogLevel::DEBUG,
                            std::string("Opened ") +
                                toString(header.fileType) + " file with " +
                                std::to_string(body / header.entrySize) +
                                " entries");
  return SleepFile(storage, header);
}

uint64_t SleepFile::entryOffset(uint64_t index) const {
  return HEADER_SIZE + index * header_.entrySize;
}

void SleepFile::requireEntrySize(size_t size) const {
  if (size != header_.entrySize) {
    throw SleepError(ErrorCode::TruncatedEntry,
                     "record of " + std::to_string(size) +
                         " bytes in a file of " +
                         std::to_string(header_.entrySize) + "-byte entries");
  }
}

uint64_t SleepFile::entryCount() {
  uint64_t total = storage_->size();
  uint64_t body = total > HEADER_SIZE ? total - HEADER_SIZE : 0;
  if (body % header_.entrySize != 0) {
    throw SleepError::atOffset(ErrorCode::MisalignedBody,
                               total - body % header_.entrySize,
                               "trailing partial entry");
  }
  return body / header_.entrySize;
}

std::vector<uint8_t> SleepFile::readRaw(uint64_t index) {
  if (index >= entryCount()) {
    throw SleepError::atIndex(ErrorCode::InvalidIndex, index,
                              "entry beyond end of file");
  }
  return storage_->read(entryOffset(index), header_.entrySize);
}

Entry SleepFile::readEntry(uint64_t index) {
  return parseEntry(readRaw(index), header_.entrySize);
}

SignatureArray SleepFile::readSignature(uint64_t index) {
  return parseSignature(readRaw(index));
}

void SleepFile::writeEntry(uint64_t index, const Entry &entry) {
  requireEntrySize(ENTRY_SIZE);
  // Keep the end of the entry addressable as a signed file offset.
  constexpr uint64_t maxEnd =
      static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  if (index >= (maxEnd - HEADER_SIZE) / header_.entrySize) {
    throw SleepError::atIndex(ErrorCode::InvalidIndex, index,
                              "entry offset beyond maximum file size");
  }
  auto bytes = serializeEntry(entry);
  storage_->write(entryOffset(index), bytes);
}

uint64_t SleepFile::appendRecord(std::span<const uint8_t> record) {
  // Rejects a misaligned body before anything is written.
  entryCount();
  uint64_t offset = storage_->append(record);
  return (offset - HEADER_SIZE) / header_.entrySize;
}

uint64_t SleepFile::appendEntry(const Entry &entry) {
  requireEntrySize(ENTRY_SIZE);
  auto bytes = serializeEntry(entry);
  return appendRecord(bytes);
}

uint64_t SleepFile::appendSignature(const SignatureArray &signature) {
  requireEntrySize(SIGNATURE_SIZE);
  return appendRecord(signature);
}

std::vector<uint8_t> SleepFile::readBody() {
  uint64_t count = entryCount();
  return storage_->read(HEADER_SIZE, count * header_.entrySize);
}

MerkleTree TreeFile::load(SleepFile &file, NodeHasher hasher) {
  if (file.header().fileType != FileType::Tree) {
    throw SleepError(ErrorCode::UnknownFileType,
                     std::string("expected a Tree file, got ") +
                         toString(file.header().fileType));
  }
  std::vector<uint8_t> body = file.readBody();
  EntryView view(body, file.header().entrySize);
  MerkleTree tree(std::move(hasher));
  uint64_t index = 0;
  for (const Entry &entry : view) {
    if (!entry.isBlank()) {
      tree.insert(index, entry);
    }
    ++index;
  }
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Loaded tree with " +
                                std::to_string(tree.leafCount()) + " leaves");
  return tree;
}

void dumpEntries(SleepFile &file, std::ostream &out) {
  uint64_t count = file.entryCount();
  FileType type = file.header().fileType;
  if (type == FileType::Signatures) {
    for (uint64_t i = 0; i < count; ++i) {
      out << i << '\t' << toHex(file.readSignature(i)) << '\n';
    }
    return;
  }
  // Only tree records are flat-tree nodes with a depth.
  bool tree = type == FileType::Tree;
  out << (tree ? "Index\tDepth\tLength\tHash" : "Index\tLength\tHash") << '\n';
  for (uint64_t i = 0; i < count; ++i) {
    Entry e = file.readEntry(i);
    out << i << '\t';
    if (e.isBlank()) {
      out << (tree ? "-\t-\t(empty)" : "-\t(empty)") << '\n';
      continue;
    }
    if (tree) {
      out << flat_tree::depth(i) << '\t';
    }
    out << e.byteLength << '\t' << toHex(e.hash) << '\n';
  }
}

void TreeFile::persist(const MerkleTree &tree, SleepFile &file,
                       const std::vector<uint64_t> &indices) {
  for (uint64_t index : indices) {
    file.writeEntry(index, tree.get(index));
  }
}

void TreeFile::persistAll(const MerkleTree &tree, SleepFile &file) {
  for (uint64_t index = 0; index < tree.size(); ++index) {
    if (tree.has(index)) {
      file.writeEntry(index, tree.get(index));
    }
  }
}

} // namespace sleepfile
