#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string_view>

namespace chunkwise::utf8 {

/// A UTF-8 lead byte is followed by at most this many continuation bytes.
constexpr std::size_t kMaxContinuationBytes = 3;

/// Result of scanning a byte sequence for UTF-8 validity.
///
/// `valid_up_to` is the length of the longest valid prefix.  When the scan
/// stopped early, `error_len` is the length of the offending invalid
/// subsequence, or 0 when the input simply ends inside a sequence that more
/// bytes could still complete.
struct Scan {
  std::size_t valid_up_to{0};
  std::size_t error_len{0};

  bool incomplete_tail(std::size_t size) const {
    return valid_up_to < size && error_len == 0;
  }
};

inline bool is_continuation(unsigned char b) { return (b & 0xC0) == 0x80; }

/// Encoded length announced by a lead byte, or 0 if the byte cannot start a
/// sequence (stray continuation byte, overlong lead, or beyond U+10FFFF).
inline std::size_t sequence_length(unsigned char lead) {
  if (lead < 0x80) return 1;
  if (lead >= 0xC2 && lead <= 0xDF) return 2;
  if (lead >= 0xE0 && lead <= 0xEF) return 3;
  if (lead >= 0xF0 && lead <= 0xF4) return 4;
  return 0;
}

/// Scan `bytes` and report how much of it is well-formed UTF-8.
/// Rejects overlong forms, surrogates and code points above U+10FFFF.
inline Scan scan(std::string_view bytes) {
  const std::size_t n = bytes.size();
  std::size_t i = 0;
  while (i < n) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }
    const std::size_t len = sequence_length(lead);
    if (len == 0) return {i, 1};

    // The second byte carries the overlong / surrogate / range restrictions.
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead == 0xE0) lo = 0xA0;
    else if (lead == 0xED) hi = 0x9F;
    else if (lead == 0xF0) lo = 0x90;
    else if (lead == 0xF4) hi = 0x8F;

    for (std::size_t j = 1; j < len; ++j) {
      if (i + j >= n) return {i, 0};
      const auto c = static_cast<unsigned char>(bytes[i + j]);
      const unsigned char min = (j == 1) ? lo : 0x80;
      const unsigned char max = (j == 1) ? hi : 0xBF;
      if (c < min || c > max) return {i, j};
    }
    i += len;
  }
  return {n, 0};
}

inline bool is_valid(std::string_view bytes) {
  return scan(bytes).valid_up_to == bytes.size();
}

/// True if `pos` falls between two complete characters of `text`.
/// Offsets 0 and `text.size()` are always boundaries.
inline bool is_char_boundary(std::string_view text, std::size_t pos) {
  if (pos == 0 || pos == text.size()) return true;
  if (pos > text.size()) return false;
  return !is_continuation(static_cast<unsigned char>(text[pos]));
}

/// Nearest character boundary at or before `pos`, looking back at most
/// kMaxContinuationBytes bytes and never below `min_pos`.
inline std::optional<std::size_t> boundary_at_or_before(std::string_view text,
                                                        std::size_t pos,
                                                        std::size_t min_pos) {
  const std::size_t floor =
      pos >= kMaxContinuationBytes ? pos - kMaxContinuationBytes : 0;
  const std::size_t lower = std::max(floor, min_pos);
  for (std::size_t i = pos + 1; i-- > lower;) {
    if (is_char_boundary(text, i)) return i;
  }
  return std::nullopt;
}

/// Number of characters in already-validated text.
inline std::size_t count_chars(std::string_view text) {
  std::size_t count = 0;
  for (char c : text) {
    if (!is_continuation(static_cast<unsigned char>(c))) ++count;
  }
  return count;
}

}  // namespace chunkwise::utf8
