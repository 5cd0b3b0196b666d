#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "chunking/byte_range.hpp"

namespace chunkwise {

/// Location of one character inside a text buffer.
struct CharPosition {
  std::size_t start{0};  ///< Byte offset of the first byte.
  std::size_t len{0};    ///< Encoded length in bytes (1-4).
};

/// One entry per character, in text order.
using CharTable = std::vector<CharPosition>;

/// Position of the next window under the character strategy.  `chars`
/// indexes the CharTable and `bytes` is the matching byte offset.
struct CharCursor {
  std::size_t chars{0};
  std::size_t bytes{0};
};

/// Append an entry for every character of the valid UTF-8 `text`, with byte
/// offsets shifted by `offset` (the position of `text` in the buffer).
void append_char_positions(std::string_view text, std::size_t offset, CharTable& table);

inline CharTable build_char_positions(std::string_view text) {
  CharTable table;
  table.reserve(text.size());
  append_char_positions(text, 0, table);
  return table;
}

/// Drop the first `chars` entries and shift the remaining offsets down by
/// `bytes`, the byte length of the dropped prefix.
void drop_char_prefix(CharTable& table, std::size_t chars, std::size_t bytes);

/// Compute the next window of at most `chunk_size` characters.
///
/// The window starts at `cursor` and ends after the last character it
/// covers, or at `text.size()` when it reaches the final character.  The
/// cursor then advances by `chunk_size - overlap` characters.  Returns
/// std::nullopt once the cursor has passed the last character.
///
/// The caller must have checked `overlap < chunk_size` (see validate_window).
/// @throws ChunkingError(Internal) if the parameters allow no progress.
std::optional<ByteRange> next_char_window(std::string_view text,
                                          const CharTable& table,
                                          std::size_t chunk_size,
                                          std::size_t overlap,
                                          CharCursor& cursor);

}  // namespace chunkwise
