#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "chunking/byte_range.hpp"

namespace chunkwise {

/// Compute the next window of at most `chunk_size` bytes starting at `cursor`.
///
/// The end is pulled back onto a character boundary so a multi-byte
/// character is never split.  The cursor is advanced by the realized window
/// length minus `overlap`, pulled back (never forward) onto a character
/// boundary so consecutive windows share at least `overlap` bytes.  When the
/// window reaches the end of `text` the cursor jumps to `text.size()` and the
/// following call returns std::nullopt.
///
/// The caller must have checked `overlap < chunk_size` (see validate_window).
/// @throws ChunkingError(Internal) if no boundary lies within reach or the
///         cursor cannot move forward, e.g. a window narrower than a 4-byte
///         character.
std::optional<ByteRange> next_byte_window(std::string_view text,
                                          std::size_t chunk_size,
                                          std::size_t overlap,
                                          std::size_t& cursor);

}  // namespace chunkwise
