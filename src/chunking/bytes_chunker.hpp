#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "chunking/chunker.hpp"
#include "text/block_decoder.hpp"

namespace chunkwise {

/// Byte-length chunks over a string held entirely in memory.
class StringBytesChunker final : public Chunker {
public:
  /// @throws ChunkingError(InvalidArguments) if overlap >= chunk_size.
  /// @throws ChunkingError(Decode) if `text` is not valid UTF-8 and the
  ///         policy is DecodePolicy::Strict.
  StringBytesChunker(std::string text, std::size_t chunk_size, std::size_t overlap,
                     const ChunkerOptions& options = {});

  const std::string& text() const { return text_; }
  std::size_t position() const { return cursor_; }

protected:
  std::optional<std::string> produce() override;

private:
  std::size_t chunk_size_;
  std::size_t overlap_;
  std::string text_;
  std::size_t cursor_{0};
};

/// Byte-length chunks streamed from a file with bounded memory.
///
/// Decoded text is accumulated in a working buffer until `5 * chunk_size`
/// bytes lie ahead of the cursor (or the file ends).  Once the cursor is
/// more than `5 * chunk_size` bytes into the buffer, everything before
/// `cursor - 2 * chunk_size` is dropped.  Output is identical to
/// StringBytesChunker over the same content for any block size.
class FileBytesChunker final : public Chunker {
public:
  /// @throws ChunkingError(InvalidArguments) if overlap >= chunk_size; this is
  ///         checked before the file is touched.
  /// @throws ChunkingError(Io) if the file cannot be opened.
  FileBytesChunker(const std::string& path, std::size_t chunk_size, std::size_t overlap,
                   const ChunkerOptions& options = {});

  /// Bytes currently held in the working buffer.
  std::size_t buffered_bytes() const { return buffer_.size(); }
  const BlockDecoder& decoder() const { return decoder_; }

protected:
  std::optional<std::string> produce() override;

private:
  void fill();
  void compact();

  std::size_t chunk_size_;
  std::size_t overlap_;
  std::size_t lookahead_;
  std::size_t retained_;
  BlockDecoder decoder_;
  std::string buffer_;
  std::size_t cursor_{0};
  bool file_done_{false};
};

std::unique_ptr<Chunker> chunk_string_by_bytes(std::string text, std::size_t chunk_size,
                                               std::size_t overlap,
                                               const ChunkerOptions& options = {});

std::unique_ptr<Chunker> chunk_file_by_bytes(const std::string& path, std::size_t chunk_size,
                                             std::size_t overlap,
                                             const ChunkerOptions& options = {});

}  // namespace chunkwise
