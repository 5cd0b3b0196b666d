#include "chunking/bytes_chunker.hpp"

#include <utility>

#include "chunking/byte_window.hpp"
#include "text/utf8.hpp"

namespace chunkwise {

// ---------------------------------------------------------------------------
// StringBytesChunker
// ---------------------------------------------------------------------------

StringBytesChunker::StringBytesChunker(std::string text, std::size_t chunk_size,
                                       std::size_t overlap, const ChunkerOptions& options)
    : chunk_size_(detail::checked_chunk_size(chunk_size, overlap)),
      overlap_(overlap),
      text_(decode_text(std::move(text), options.decode_policy, options.diagnostics)) {}

std::optional<std::string> StringBytesChunker::produce() {
  auto range = next_byte_window(text_, chunk_size_, overlap_, cursor_);
  if (!range) return std::nullopt;
  return text_.substr(range->start, range->size());
}

// ---------------------------------------------------------------------------
// FileBytesChunker
// ---------------------------------------------------------------------------

FileBytesChunker::FileBytesChunker(const std::string& path, std::size_t chunk_size,
                                   std::size_t overlap, const ChunkerOptions& options)
    : chunk_size_(detail::checked_chunk_size(chunk_size, overlap)),
      overlap_(overlap),
      lookahead_(detail::scaled(chunk_size, detail::kLookaheadChunks)),
      retained_(detail::scaled(chunk_size, detail::kRetainedChunks)),
      decoder_(path, options.block_size, options.decode_policy, options.diagnostics) {}

std::optional<std::string> FileBytesChunker::produce() {
  while (true) {
    compact();
    fill();

    if (auto range = next_byte_window(buffer_, chunk_size_, overlap_, cursor_)) {
      return buffer_.substr(range->start, range->size());
    }
    if (file_done_) return std::nullopt;
  }
}

void FileBytesChunker::fill() {
  while (!file_done_ && buffer_.size() - cursor_ < lookahead_) {
    auto block = decoder_.next();
    if (!block) {
      file_done_ = true;
      break;
    }
    buffer_ += *block;
  }
}

void FileBytesChunker::compact() {
  if (cursor_ <= lookahead_) return;

  std::size_t keep_from = cursor_ - retained_;
  while (keep_from > 0 && !utf8::is_char_boundary(buffer_, keep_from)) {
    --keep_from;
  }
  buffer_.erase(0, keep_from);
  cursor_ -= keep_from;
}

std::unique_ptr<Chunker> chunk_string_by_bytes(std::string text, std::size_t chunk_size,
                                               std::size_t overlap,
                                               const ChunkerOptions& options) {
  return std::make_unique<StringBytesChunker>(std::move(text), chunk_size, overlap, options);
}

std::unique_ptr<Chunker> chunk_file_by_bytes(const std::string& path, std::size_t chunk_size,
                                             std::size_t overlap,
                                             const ChunkerOptions& options) {
  return std::make_unique<FileBytesChunker>(path, chunk_size, overlap, options);
}

}  // namespace chunkwise
