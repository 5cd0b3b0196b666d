#include "chunking/byte_window.hpp"

#include <algorithm>
#include <string>

#include "chunking/chunking_error.hpp"
#include "text/utf8.hpp"

namespace chunkwise {

std::optional<ByteRange> next_byte_window(std::string_view text,
                                          std::size_t chunk_size,
                                          std::size_t overlap,
                                          std::size_t& cursor) {
  const std::size_t text_len = text.size();
  if (cursor >= text_len) return std::nullopt;

  const std::size_t start = cursor;
  if (!utf8::is_char_boundary(text, start)) {
    throw ChunkingError::internal("start position " + std::to_string(start) +
                                  " is not on a character boundary");
  }

  const std::size_t target_end = start + std::min(chunk_size, text_len - start);
  std::size_t end = target_end;
  if (target_end != text_len && !utf8::is_char_boundary(text, target_end)) {
    auto boundary = utf8::boundary_at_or_before(text, target_end, start + 1);
    if (!boundary) {
      throw ChunkingError::internal("no character boundary found before offset " +
                                    std::to_string(target_end));
    }
    end = *boundary;
  }

  // Final window.
  if (end >= text_len) {
    cursor = text_len;
    return ByteRange{start, end};
  }

  const std::size_t chunk_len = end - start;
  if (chunk_len <= overlap) {
    throw ChunkingError::internal(
        "no forward progress: chunk_len=" + std::to_string(chunk_len) +
        ", overlap=" + std::to_string(overlap) +
        ", chunk_size=" + std::to_string(chunk_size));
  }

  const std::size_t next_pos = start + (chunk_len - overlap);
  auto next = utf8::boundary_at_or_before(text, next_pos, start + 1);
  if (!next) {
    throw ChunkingError::internal("no forward progress from offset " +
                                  std::to_string(start) + ": no character boundary in (" +
                                  std::to_string(start) + ", " +
                                  std::to_string(next_pos) + "]");
  }
  cursor = *next;
  return ByteRange{start, end};
}

}  // namespace chunkwise
