#include "sleepfile/errors.hpp"

namespace sleepfile {

const char *toString(ErrorCode code) {
  switch (code) {
  case ErrorCode::MalformedHeader:
    return "MalformedHeader";
  case ErrorCode::BadMagic:
    return "BadMagic";
  case ErrorCode::UnknownFileType:
    return "UnknownFileType";
  case ErrorCode::UnsupportedVersion:
    return "UnsupportedVersion";
  case ErrorCode::UnknownAlgorithm:
    return "UnknownAlgorithm";
  case ErrorCode::CorruptPadding:
    return "CorruptPadding";
  case ErrorCode::TruncatedEntry:
    return "TruncatedEntry";
  case ErrorCode::MisalignedBody:
    return "MisalignedBody";
  case ErrorCode::InvalidIndex:
    return "InvalidIndex";
  case ErrorCode::LeafHasNoChildren:
    return "LeafHasNoChildren";
  case ErrorCode::HashMismatch:
    return "HashMismatch";
  case ErrorCode::IncompleteTree:
    return "IncompleteTree";
  case ErrorCode::NoSingleRoot:
    return "NoSingleRoot";
  case ErrorCode::BlankEntry:
    return "BlankEntry";
  case ErrorCode::Io:
    return "Io";
  case ErrorCode::Crypto:
    return "Crypto";
  default:
    return "Unknown";
  }
}

SleepError::SleepError(ErrorCode code, const std::string &message)
    : std::runtime_error(std::string(toString(code)) + ": " + message),
      code_(code) {}

SleepError SleepError::atIndex(ErrorCode code, uint64_t index,
                               const std::string &message) {
  SleepError err(code, message + " (index " + std::to_string(index) + ")");
  err.index_ = index;
  return err;
}

SleepError SleepError::atOffset(ErrorCode code, uint64_t offset,
                                const std::string &message) {
  SleepError err(code, message + " (offset " + std::to_string(offset) + ")");
  err.offset_ = offset;
  return err;
}

} // namespace sleepfile
