#include "chunking/characters_chunker.hpp"

#include <utility>

namespace chunkwise {

// ---------------------------------------------------------------------------
// StringCharactersChunker
// ---------------------------------------------------------------------------

StringCharactersChunker::StringCharactersChunker(std::string text, std::size_t chunk_size,
                                                 std::size_t overlap,
                                                 const ChunkerOptions& options)
    : chunk_size_(detail::checked_chunk_size(chunk_size, overlap)),
      overlap_(overlap),
      text_(decode_text(std::move(text), options.decode_policy, options.diagnostics)),
      table_(build_char_positions(text_)) {}

std::optional<std::string> StringCharactersChunker::produce() {
  auto range = next_char_window(text_, table_, chunk_size_, overlap_, cursor_);
  if (!range) return std::nullopt;
  return text_.substr(range->start, range->size());
}

// ---------------------------------------------------------------------------
// FileCharactersChunker
// ---------------------------------------------------------------------------

FileCharactersChunker::FileCharactersChunker(const std::string& path, std::size_t chunk_size,
                                             std::size_t overlap,
                                             const ChunkerOptions& options)
    : chunk_size_(detail::checked_chunk_size(chunk_size, overlap)),
      overlap_(overlap),
      lookahead_(detail::scaled(chunk_size, detail::kLookaheadChunks)),
      retained_(detail::scaled(chunk_size, detail::kRetainedChunks)),
      decoder_(path, options.block_size, options.decode_policy, options.diagnostics) {}

std::optional<std::string> FileCharactersChunker::produce() {
  while (true) {
    compact();
    fill();

    if (auto range = next_char_window(buffer_, table_, chunk_size_, overlap_, cursor_)) {
      return buffer_.substr(range->start, range->size());
    }
    if (file_done_) return std::nullopt;
  }
}

void FileCharactersChunker::fill() {
  while (!file_done_ && table_.size() - cursor_.chars < lookahead_) {
    auto block = decoder_.next();
    if (!block) {
      file_done_ = true;
      break;
    }
    append_char_positions(*block, buffer_.size(), table_);
    buffer_ += *block;
  }
}

void FileCharactersChunker::compact() {
  if (cursor_.chars <= lookahead_) return;

  const std::size_t keep_chars = cursor_.chars - retained_;
  const std::size_t keep_bytes = table_[keep_chars].start;
  buffer_.erase(0, keep_bytes);
  drop_char_prefix(table_, keep_chars, keep_bytes);
  cursor_.chars -= keep_chars;
  cursor_.bytes -= keep_bytes;
}

std::unique_ptr<Chunker> chunk_string_by_characters(std::string text, std::size_t chunk_size,
                                                    std::size_t overlap,
                                                    const ChunkerOptions& options) {
  return std::make_unique<StringCharactersChunker>(std::move(text), chunk_size, overlap,
                                                   options);
}

std::unique_ptr<Chunker> chunk_file_by_characters(const std::string& path,
                                                  std::size_t chunk_size, std::size_t overlap,
                                                  const ChunkerOptions& options) {
  return std::make_unique<FileCharactersChunker>(path, chunk_size, overlap, options);
}

}  // namespace chunkwise
