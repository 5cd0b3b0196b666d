#pragma once

#include <cstddef>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include "chunking/chunking_error.hpp"

namespace chunkwise {

/// What to do with bytes that can never form valid UTF-8.
enum class DecodePolicy {
  Strict,  ///< Throw ChunkingError(Decode) at the first malformed sequence.
  Skip     ///< Drop the malformed bytes, print a warning, keep going.
};

/// Reads a file in fixed-size blocks and yields decoded UTF-8 text.
///
/// Each call to `next()` reads one block, prepends the bytes left over from
/// the previous call and returns the longest valid UTF-8 prefix.  A multi-byte
/// character split across two reads is carried forward (at most 3 bytes) and
/// completed by the following block, so every returned string is valid UTF-8
/// and the concatenation of all returned strings equals the decoded file.
///
/// Single pass: once `next()` returns std::nullopt the decoder stays exhausted,
/// and once it has thrown every later call throws the same error.
class BlockDecoder {
public:
  static constexpr std::size_t kDefaultBlockSize = 8 * 1024;
  /// Largest accepted block size; one block is held in memory at a time.
  static constexpr std::size_t kMaxBlockSize = 256 * 1024 * 1024;

  /// Opens `path` for reading.
  /// @throws ChunkingError(Io) if the file cannot be opened.
  /// @throws std::invalid_argument if block_size is 0 or above kMaxBlockSize.
  explicit BlockDecoder(const std::string& path,
                        std::size_t block_size = kDefaultBlockSize,
                        DecodePolicy policy = DecodePolicy::Strict,
                        std::ostream* diagnostics = &std::cerr);

  BlockDecoder(const BlockDecoder&) = delete;
  BlockDecoder& operator=(const BlockDecoder&) = delete;
  BlockDecoder(BlockDecoder&&) = default;
  BlockDecoder& operator=(BlockDecoder&&) = default;

  /// Next piece of decoded text, never empty; std::nullopt once the file is
  /// exhausted.
  /// @throws ChunkingError(Io) on a read failure.
  /// @throws ChunkingError(Decode) on malformed input under DecodePolicy::Strict.
  std::optional<std::string> next();

  bool exhausted() const { return done_; }
  bool failed() const { return failure_.has_value(); }
  std::size_t block_size() const { return block_size_; }
  DecodePolicy policy() const { return policy_; }

  /// Raw bytes read from the file so far.
  std::size_t bytes_read() const { return bytes_read_; }
  /// Bytes dropped under DecodePolicy::Skip.
  std::size_t skipped_bytes() const { return skipped_bytes_; }
  /// Undecoded bytes held back for the next call (never more than 3).
  std::size_t pending_bytes() const { return pending_.size(); }

  const std::string& path() const { return path_; }

private:
  /// Apply the decode policy to `len` malformed bytes at file offset `offset`.
  void reject(std::size_t offset, std::size_t len, const char* what);
  [[noreturn]] void fail(ChunkingError error);

  std::string path_;
  std::ifstream in_;
  std::size_t block_size_;
  DecodePolicy policy_;
  std::ostream* diagnostics_;

  std::string pending_;
  bool eof_{false};
  bool done_{false};
  std::optional<ChunkingError> failure_;
  std::size_t bytes_read_{0};
  std::size_t skipped_bytes_{0};
};

/// @throws std::invalid_argument unless 0 < block_size <= BlockDecoder::kMaxBlockSize.
void validate_block_size(std::size_t block_size);

/// Apply the decode policy to a whole in-memory string.
///
/// Valid input is returned unchanged.  Under DecodePolicy::Skip malformed
/// bytes are removed (with a warning to `diagnostics` if non-null); under
/// DecodePolicy::Strict the first one raises ChunkingError(Decode).
std::string decode_text(std::string text, DecodePolicy policy,
                        std::ostream* diagnostics = &std::cerr);

}  // namespace chunkwise
