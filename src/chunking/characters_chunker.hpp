#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "chunking/char_window.hpp"
#include "chunking/chunker.hpp"
#include "text/block_decoder.hpp"

namespace chunkwise {

/// Character-length chunks over a string held entirely in memory.
/// The character offset table for the whole string lives as long as the
/// chunker does.
class StringCharactersChunker final : public Chunker {
public:
  /// @throws ChunkingError(InvalidArguments) if overlap >= chunk_size.
  /// @throws ChunkingError(Decode) if `text` is not valid UTF-8 and the
  ///         policy is DecodePolicy::Strict.
  StringCharactersChunker(std::string text, std::size_t chunk_size, std::size_t overlap,
                          const ChunkerOptions& options = {});

  const std::string& text() const { return text_; }
  std::size_t num_chars() const { return table_.size(); }
  const CharCursor& position() const { return cursor_; }

protected:
  std::optional<std::string> produce() override;

private:
  std::size_t chunk_size_;
  std::size_t overlap_;
  std::string text_;
  CharTable table_;
  CharCursor cursor_;
};

/// Character-length chunks streamed from a file with bounded memory.
///
/// Works like FileBytesChunker with sizes counted in characters.  The
/// character offset table is extended as blocks arrive and trimmed together
/// with the buffer on compaction, its offsets rebased to the new origin.
class FileCharactersChunker final : public Chunker {
public:
  /// @throws ChunkingError(InvalidArguments) if overlap >= chunk_size; this is
  ///         checked before the file is touched.
  /// @throws ChunkingError(Io) if the file cannot be opened.
  FileCharactersChunker(const std::string& path, std::size_t chunk_size,
                        std::size_t overlap, const ChunkerOptions& options = {});

  std::size_t buffered_bytes() const { return buffer_.size(); }
  std::size_t buffered_chars() const { return table_.size(); }
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
  CharTable table_;
  CharCursor cursor_;
  bool file_done_{false};
};

std::unique_ptr<Chunker> chunk_string_by_characters(std::string text, std::size_t chunk_size,
                                                    std::size_t overlap,
                                                    const ChunkerOptions& options = {});

std::unique_ptr<Chunker> chunk_file_by_characters(const std::string& path,
                                                  std::size_t chunk_size, std::size_t overlap,
                                                  const ChunkerOptions& options = {});

}  // namespace chunkwise
