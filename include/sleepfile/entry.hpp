#ifndef SLEEPFILE_ENTRY_HPP
#define SLEEPFILE_ENTRY_HPP

#include "sleepfile/digest.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>

namespace sleepfile {

/// Width of a tree or bitfield entry: 32-byte hash + 8-byte length.
inline constexpr size_t ENTRY_SIZE = DIGEST_SIZE + 8;

/**
 * @brief One tree/bitfield record.
 *
 * For a leaf, the content hash and raw length of a data block. For an
 * internal node, the combined hash and total byte length of its subtree.
 */
struct Entry {
  DigestArray hash{};
  uint64_t byteLength{0};

  /// All-zero record. Tree files use it for slots not written yet.
  bool isBlank() const;

  bool operator==(const Entry &) const = default;
};

/// @throw SleepError TruncatedEntry if bytes.size() != entrySize or the
///        entry size is not ENTRY_SIZE.
Entry parseEntry(std::span<const uint8_t> bytes, size_t entrySize = ENTRY_SIZE);

std::array<uint8_t, ENTRY_SIZE> serializeEntry(const Entry &entry);

/// @throw SleepError TruncatedEntry if bytes.size() != SIGNATURE_SIZE.
SignatureArray parseSignature(std::span<const uint8_t> bytes);

/// Big-endian helpers shared by the codecs.
uint64_t readUint64BE(const uint8_t *p);
void writeUint64BE(uint64_t value, uint8_t *p);

/**
 * @brief Lazy view of a file body as a sequence of entries.
 *
 * Does not own the bytes. Entries are decoded when the iterator is
 * dereferenced, so the view can be walked any number of times.
 */
class EntryView {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Entry;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = Entry;

    iterator() = default;
    iterator(const EntryView *view, size_t pos) : view_(view), pos_(pos) {}

    Entry operator*() const { return view_->at(pos_); }
    iterator &operator++() {
      ++pos_;
      return *this;
    }
    iterator operator++(int) {
      iterator tmp = *this;
      ++pos_;
      return tmp;
    }
    bool operator==(const iterator &other) const {
      return view_ == other.view_ && pos_ == other.pos_;
    }

  private:
    const EntryView *view_{nullptr};
    size_t pos_{0};
  };

  /// @throw SleepError MisalignedBody if body.size() % entrySize != 0.
  EntryView(std::span<const uint8_t> body, size_t entrySize = ENTRY_SIZE);

  size_t size() const { return body_.size() / entrySize_; }
  bool empty() const { return body_.empty(); }

  /// Decode entry i. Throws InvalidIndex when i >= size().
  Entry at(size_t i) const;
  /// Raw bytes of entry i.
  std::span<const uint8_t> raw(size_t i) const;

  iterator begin() const { return iterator(this, 0); }
  iterator end() const { return iterator(this, size()); }

private:
  std::span<const uint8_t> body_;
  size_t entrySize_;
};

} // namespace sleepfile

#endif // SLEEPFILE_ENTRY_HPP
