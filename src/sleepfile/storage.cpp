#include "sleepfile/storage.hpp"
#include "sleepfile/errors.hpp"
#include "sleepfile/logger.h"

#include <algorithm>
#include <filesystem>
#include <limits>
#include <new>

namespace sleepfile {

MemoryStorage::MemoryStorage(std::vector<uint8_t> bytes)
    : buffer_(std::move(bytes)) {}

std::vector<uint8_t> MemoryStorage::read(uint64_t offset, uint64_t length) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (offset > buffer_.size() || length > buffer_.size() - offset) {
    throw SleepError::atOffset(ErrorCode::Io, offset,
                               "read of " + std::to_string(length) +
                                   " bytes past end of buffer");
  }
  return std::vector<uint8_t>(buffer_.begin() + offset,
                              buffer_.begin() + offset + length);
}

void MemoryStorage::writeLocked(uint64_t offset,
                                std::span<const uint8_t> bytes) {
  if (bytes.size() > buffer_.max_size() ||
      offset > buffer_.max_size() - bytes.size()) {
    throw SleepError::atOffset(ErrorCode::Io, offset,
                               "write beyond buffer capacity");
  }
  if (offset + bytes.size() > buffer_.size()) {
    try {
      buffer_.resize(offset + bytes.size(), 0);
    } catch (const std::bad_alloc &) {
      throw SleepError::atOffset(ErrorCode::Io, offset,
                                 "no memory to extend buffer");
    }
  }
  std::copy(bytes.begin(), bytes.end(), buffer_.begin() + offset);
}

void MemoryStorage::write(uint64_t offset, std::span<const uint8_t> bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  writeLocked(offset, bytes);
}

uint64_t MemoryStorage::append(std::span<const uint8_t> bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t offset = buffer_.size();
  writeLocked(offset, bytes);
  return offset;
}

uint64_t MemoryStorage::size() {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_.size();
}

std::vector<uint8_t> MemoryStorage::bytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_;
}

FileStorage::FileStorage(const std::string &path) : path_(path) {
  if (!std::filesystem::exists(path_)) {
    std::ofstream create(path_, std::ios::binary);
    if (!create.is_open()) {
      throw SleepError(ErrorCode::Io, "Could not create file: " + path_);
    }
  }
  stream_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
  if (!stream_.is_open()) {
    throw SleepError(ErrorCode::Io, "Could not open file: " + path_);
  }
  Logger::getInstance().log(LogLevel::DEBUG, "Opened storage " + path_);
}

FileStorage::~FileStorage() {
  if (stream_.is_open()) {
    stream_.flush();
    stream_.close();
  }
}

std::vector<uint8_t> FileStorage::read(uint64_t offset, uint64_t length) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_.clear();
  stream_.seekg(0, std::ios::end);
  uint64_t end = static_cast<uint64_t>(stream_.tellg());
  if (offset > end || length > end - offset) {
    throw SleepError::atOffset(ErrorCode::Io, offset,
                               "read of " + std::to_string(length) +
                                   " bytes past end of " + path_);
  }
  std::vector<uint8_t> out(length);
  stream_.seekg(static_cast<std::streamoff>(offset));
  stream_.read(reinterpret_cast<char *>(out.data()),
               static_cast<std::streamsize>(length));
  if (!stream_) {
    throw SleepError::atOffset(ErrorCode::Io, offset,
                               "short read from " + path_);
  }
  return out;
}

uint64_t FileStorage::endLocked() {
  stream_.clear();
  stream_.seekp(0, std::ios::end);
  return static_cast<uint64_t>(stream_.tellp());
}

void FileStorage::writeLocked(uint64_t offset, std::span<const uint8_t> bytes) {
  constexpr uint64_t maxOffset =
      static_cast<uint64_t>(std::numeric_limits<std::streamoff>::max());
  if (bytes.size() > maxOffset || offset > maxOffset - bytes.size()) {
    throw SleepError::atOffset(ErrorCode::Io, offset,
                               "write beyond maximum file size of " + path_);
  }
  uint64_t end = endLocked();
  if (offset > end) {
    std::vector<char> zeros(std::min<uint64_t>(offset - end, 64 * 1024), 0);
    for (uint64_t left = offset - end; left > 0 && stream_;) {
      uint64_t n = std::min<uint64_t>(left, zeros.size());
      stream_.write(zeros.data(), static_cast<std::streamsize>(n));
      left -= n;
    }
  }
  stream_.seekp(static_cast<std::streamoff>(offset));
  stream_.write(reinterpret_cast<const char *>(bytes.data()),
                static_cast<std::streamsize>(bytes.size()));
  stream_.flush();
  if (!stream_) {
    throw SleepError::atOffset(ErrorCode::Io, offset,
                               "write failed on " + path_);
  }
}

void FileStorage::write(uint64_t offset, std::span<const uint8_t> bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  writeLocked(offset, bytes);
}

uint64_t FileStorage::append(std::span<const uint8_t> bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t offset = endLocked();
  writeLocked(offset, bytes);
  return offset;
}

uint64_t FileStorage::size() {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_.clear();
  stream_.seekg(0, std::ios::end);
  return static_cast<uint64_t>(stream_.tellg());
}

} // namespace sleepfile
