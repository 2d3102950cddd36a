#ifndef SLEEPFILE_STORAGE_HPP
#define SLEEPFILE_STORAGE_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace sleepfile {

/**
 * @brief Random-access byte storage behind a SLEEP file.
 *
 * Implementations throw SleepError(Io) on failure.
 */
class ByteRangeProvider {
public:
  virtual ~ByteRangeProvider() = default;

  /// Read exactly @p length bytes starting at @p offset.
  virtual std::vector<uint8_t> read(uint64_t offset, uint64_t length) = 0;

  /// Overwrite or extend at @p offset. A write past the end zero-fills the gap.
  virtual void write(uint64_t offset, std::span<const uint8_t> bytes) = 0;

  /// Append at the current end as one step.
  /// @return Offset the bytes were written at.
  virtual uint64_t append(std::span<const uint8_t> bytes) = 0;

  virtual uint64_t size() = 0;
};

/// Storage held in a byte vector.
class MemoryStorage : public ByteRangeProvider {
public:
  MemoryStorage() = default;
  explicit MemoryStorage(std::vector<uint8_t> bytes);

  std::vector<uint8_t> read(uint64_t offset, uint64_t length) override;
  void write(uint64_t offset, std::span<const uint8_t> bytes) override;
  uint64_t append(std::span<const uint8_t> bytes) override;
  uint64_t size() override;

  /// Snapshot of the whole buffer.
  std::vector<uint8_t> bytes() const;

private:
  void writeLocked(uint64_t offset, std::span<const uint8_t> bytes);

  mutable std::mutex mutex_;
  std::vector<uint8_t> buffer_;
};

/// Storage backed by a file on disk, created when missing.
class FileStorage : public ByteRangeProvider {
public:
  explicit FileStorage(const std::string &path);
  ~FileStorage() override;

  FileStorage(const FileStorage &) = delete;
  FileStorage &operator=(const FileStorage &) = delete;

  std::vector<uint8_t> read(uint64_t offset, uint64_t length) override;
  void write(uint64_t offset, std::span<const uint8_t> bytes) override;
  uint64_t append(std::span<const uint8_t> bytes) override;
  uint64_t size() override;

private:
  uint64_t endLocked();
  void writeLocked(uint64_t offset, std::span<const uint8_t> bytes);

  std::string path_;
  std::fstream stream_;
  std::mutex mutex_;
};

} // namespace sleepfile

#endif // SLEEPFILE_STORAGE_HPP
