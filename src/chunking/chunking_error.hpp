#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace chunkwise {

enum class ErrorKind {
  Io,                ///< File could not be opened or read.
  InvalidArguments,  ///< overlap >= chunk_size.
  Decode,            ///< Malformed UTF-8 under the strict decode policy.
  Internal,          ///< A window engine invariant did not hold.
  Unknown
};

inline const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Io: return "io";
    case ErrorKind::InvalidArguments: return "invalid_arguments";
    case ErrorKind::Decode: return "decode";
    case ErrorKind::Internal: return "internal";
    case ErrorKind::Unknown: break;
  }
  return "unknown";
}

/// The single exception type thrown by chunker construction and iteration.
///
/// Callers that only care about the message can catch std::runtime_error;
/// callers that want to react to the failure class inspect kind().
class ChunkingError : public std::runtime_error {
public:
  ChunkingError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  static ChunkingError io(const std::string& path) {
    return ChunkingError(ErrorKind::Io, "error reading file: " + path);
  }

  static ChunkingError invalid_arguments(std::size_t chunk_size, std::size_t overlap) {
    ChunkingError e(ErrorKind::InvalidArguments,
                    "the overlap (" + std::to_string(overlap) +
                        ") must be less than the chunk size (" +
                        std::to_string(chunk_size) + ")");
    e.chunk_size_ = chunk_size;
    e.overlap_ = overlap;
    return e;
  }

  static ChunkingError decode(const std::string& message) {
    return ChunkingError(ErrorKind::Decode, message);
  }

  static ChunkingError internal(const std::string& message) {
    return ChunkingError(ErrorKind::Internal, "internal error: " + message);
  }

  ErrorKind kind() const { return kind_; }

  /// Only meaningful for ErrorKind::InvalidArguments.
  std::size_t chunk_size() const { return chunk_size_; }
  std::size_t overlap() const { return overlap_; }

private:
  ErrorKind kind_;
  std::size_t chunk_size_{0};
  std::size_t overlap_{0};
};

/// Reject window parameters that could never make forward progress.
inline void validate_window(std::size_t chunk_size, std::size_t overlap) {
  if (overlap >= chunk_size) {
    throw ChunkingError::invalid_arguments(chunk_size, overlap);
  }
}

}  // namespace chunkwise
