#include "chunking/char_window.hpp"

#include <algorithm>
#include <string>

#include "chunking/chunking_error.hpp"
#include "text/utf8.hpp"

namespace chunkwise {

void append_char_positions(std::string_view text, std::size_t offset, CharTable& table) {
  std::size_t i = 0;
  while (i < text.size()) {
    const std::size_t len = utf8::sequence_length(static_cast<unsigned char>(text[i]));
    if (len == 0 || i + len > text.size()) {
      throw ChunkingError::internal("malformed UTF-8 at offset " +
                                    std::to_string(offset + i) +
                                    " while indexing characters");
    }
    table.push_back(CharPosition{offset + i, len});
    i += len;
  }
}

void drop_char_prefix(CharTable& table, std::size_t chars, std::size_t bytes) {
  table.erase(table.begin(), table.begin() + static_cast<std::ptrdiff_t>(chars));
  for (auto& cp : table) {
    cp.start -= bytes;
  }
}

std::optional<ByteRange> next_char_window(std::string_view text,
                                          const CharTable& table,
                                          std::size_t chunk_size,
                                          std::size_t overlap,
                                          CharCursor& cursor) {
  const std::size_t num_chars = table.size();
  if (cursor.chars >= num_chars) return std::nullopt;

  const std::size_t start_idx = cursor.chars;
  const std::size_t end_idx = start_idx + std::min(chunk_size, num_chars - start_idx);
  const std::size_t start_byte = table[start_idx].start;

  // Final window.
  if (end_idx >= num_chars) {
    cursor.chars = num_chars;
    cursor.bytes = text.size();
    return ByteRange{start_byte, text.size()};
  }

  const CharPosition& last = table[end_idx - 1];
  const std::size_t end_byte = last.start + last.len;

  if (chunk_size <= overlap) {
    throw ChunkingError::internal("no forward progress: overlap=" +
                                  std::to_string(overlap) +
                                  ", chunk_size=" + std::to_string(chunk_size));
  }
  const std::size_t next_idx = start_idx + (chunk_size - overlap);
  cursor.chars = next_idx;
  cursor.bytes = table[next_idx].start;
  return ByteRange{start_byte, end_byte};
}

}  // namespace chunkwise
