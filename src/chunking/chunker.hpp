#pragma once

#include <cstddef>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "chunking/chunking_error.hpp"
#include "text/block_decoder.hpp"

namespace chunkwise {

/// Tunables shared by every chunker.  Only file sources read blocks, but the
/// decode policy and the diagnostics sink apply to string sources as well.
struct ChunkerOptions {
  std::size_t block_size = BlockDecoder::kDefaultBlockSize;  ///< Bytes per file read.
  DecodePolicy decode_policy = DecodePolicy::Strict;
  std::ostream* diagnostics = &std::cerr;  ///< Warning sink; nullptr silences.
};

namespace detail {

/// File chunkers keep this many chunk sizes of unread text buffered ahead of
/// the cursor, and compact once the cursor is that far from the origin.
constexpr std::size_t kLookaheadChunks = 5;
/// Chunk sizes of already-read text kept behind the cursor on compaction.
constexpr std::size_t kRetainedChunks = 2;

inline std::size_t scaled(std::size_t chunk_size, std::size_t factor) {
  if (chunk_size > std::numeric_limits<std::size_t>::max() / factor) {
    return std::numeric_limits<std::size_t>::max();
  }
  return chunk_size * factor;
}

/// validate_window() for use in constructor initializer lists.
inline std::size_t checked_chunk_size(std::size_t chunk_size, std::size_t overlap) {
  validate_window(chunk_size, overlap);
  return chunk_size;
}

}  // namespace detail

/// A lazily produced, single-pass sequence of overlapping text chunks.
///
/// Every chunk is an owned, valid UTF-8 string.  Chunks are computed one at
/// a time inside `next()`; for file sources that call may read from disk.
/// A chunker is not restartable and must not be shared between threads
/// without external synchronization.  Destroying it early releases the file
/// handle and buffers.
class Chunker {
public:
  virtual ~Chunker() = default;

  Chunker(const Chunker&) = delete;
  Chunker& operator=(const Chunker&) = delete;

  /// The next chunk, or std::nullopt once the input is exhausted.
  /// @throws ChunkingError on I/O, decode or internal failures.  A chunker
  /// that has thrown is failed: every later next()/has_next() rethrows the
  /// same error.
  std::optional<std::string> next();

  /// True if another chunk is available.  The chunk is computed and held so
  /// the following `next()` returns it.
  /// @throws ChunkingError like next().
  bool has_next();

  /// Collect every remaining chunk.
  std::vector<std::string> all();

  /// Number of chunks handed out by next()/all() so far.
  std::size_t chunks_emitted() const { return emitted_; }

protected:
  Chunker() = default;

  /// Compute the next chunk from the underlying source.
  virtual std::optional<std::string> produce() = 0;

private:
  std::optional<std::string> pull();

  std::optional<std::string> peeked_;
  std::exception_ptr failure_;
  std::size_t emitted_{0};
};

}  // namespace chunkwise
