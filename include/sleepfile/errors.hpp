#ifndef SLEEPFILE_ERRORS_HPP
#define SLEEPFILE_ERRORS_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace sleepfile {

/// Every failure the library reports. All data-integrity kinds are
/// deterministic; retrying the same input yields the same error.
enum class ErrorCode {
  MalformedHeader,
  BadMagic,
  UnknownFileType,
  UnsupportedVersion,
  UnknownAlgorithm,
  CorruptPadding,
  TruncatedEntry,
  MisalignedBody,
  InvalidIndex,
  LeafHasNoChildren,
  HashMismatch,
  IncompleteTree,
  NoSingleRoot,
  BlankEntry,
  Io,
  Crypto
};

/// Stable name of an error code, e.g. "BadMagic".
const char *toString(ErrorCode code);

/**
 * @brief Exception thrown by every sleepfile operation.
 *
 * Carries the error kind and, where one applies, the byte offset inside the
 * file or the flat-tree index at which the failure was detected.
 */
class SleepError : public std::runtime_error {
public:
  SleepError(ErrorCode code, const std::string &message);

  ErrorCode code() const noexcept { return code_; }
  const std::optional<uint64_t> &index() const noexcept { return index_; }
  const std::optional<uint64_t> &offset() const noexcept { return offset_; }

  /// Build an error that points at a flat-tree index.
  static SleepError atIndex(ErrorCode code, uint64_t index,
                            const std::string &message);
  /// Build an error that points at a byte offset.
  static SleepError atOffset(ErrorCode code, uint64_t offset,
                             const std::string &message);

private:
  ErrorCode code_;
  std::optional<uint64_t> index_;
  std::optional<uint64_t> offset_;
};

} // namespace sleepfile

#endif // SLEEPFILE_ERRORS_HPP
