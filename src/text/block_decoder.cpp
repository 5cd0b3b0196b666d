#include "text/block_decoder.hpp"

#include <stdexcept>
#include <string_view>

#include "chunking/chunking_error.hpp"
#include "text/utf8.hpp"

namespace chunkwise {

namespace {

void warn_skipped(std::ostream* diagnostics, std::size_t len, std::size_t offset,
                  const std::string& origin, const char* what) {
  if (diagnostics == nullptr) return;
  *diagnostics << "Warning: skipping " << len << " " << what << " byte"
               << (len == 1 ? "" : "s") << " at offset " << offset << " in "
               << origin << "\n";
}

std::string malformed_message(std::size_t offset, const std::string& origin,
                              const char* what) {
  return std::string(what) + " UTF-8 sequence at byte offset " +
         std::to_string(offset) + " in " + origin;
}

}  // namespace

void validate_block_size(std::size_t block_size) {
  if (block_size == 0) {
    throw std::invalid_argument("block_size must be > 0");
  }
  if (block_size > BlockDecoder::kMaxBlockSize) {
    throw std::invalid_argument("block_size must be at most " +
                                std::to_string(BlockDecoder::kMaxBlockSize) + ", got " +
                                std::to_string(block_size));
  }
}

BlockDecoder::BlockDecoder(const std::string& path, std::size_t block_size,
                           DecodePolicy policy, std::ostream* diagnostics)
    : path_(path),
      in_(path, std::ios::binary),
      block_size_(block_size),
      policy_(policy),
      diagnostics_(diagnostics) {
  validate_block_size(block_size_);
  if (!in_.is_open()) {
    throw ChunkingError::io(path_);
  }
}

std::optional<std::string> BlockDecoder::next() {
  if (failure_) throw *failure_;
  while (!done_) {
    std::string buffer = std::move(pending_);
    pending_.clear();

    if (!eof_) {
      const std::size_t carried = buffer.size();
      buffer.resize(carried + block_size_);
      in_.read(buffer.data() + carried, static_cast<std::streamsize>(block_size_));
      if (in_.bad()) fail(ChunkingError::io(path_));
      const auto n = static_cast<std::size_t>(in_.gcount());
      buffer.resize(carried + n);
      bytes_read_ += n;
      if (n < block_size_) eof_ = true;
    }

    if (buffer.empty()) {
      done_ = true;
      return std::nullopt;
    }

    // File offset of buffer[0], for diagnostics.
    const std::size_t base = bytes_read_ - buffer.size();
    const std::string_view bytes(buffer);

    std::string text;
    std::size_t pos = 0;
    while (pos < bytes.size()) {
      const auto scan = utf8::scan(bytes.substr(pos));
      text.append(bytes.substr(pos, scan.valid_up_to));
      pos += scan.valid_up_to;
      if (pos == bytes.size()) break;

      if (scan.error_len == 0) {
        // Trailing partial character: complete it with the next block.
        if (!eof_) {
          pending_.assign(bytes.substr(pos));
          break;
        }
        reject(base + pos, bytes.size() - pos, "truncated");
        pos = bytes.size();
        break;
      }
      reject(base + pos, scan.error_len, "invalid");
      pos += scan.error_len;
    }

    if (!text.empty()) return text;
    // Only skipped or pending bytes in this block; keep reading.
  }
  return std::nullopt;
}

void BlockDecoder::reject(std::size_t offset, std::size_t len, const char* what) {
  if (policy_ == DecodePolicy::Strict) {
    fail(ChunkingError::decode(malformed_message(offset, path_, what)));
  }
  skipped_bytes_ += len;
  warn_skipped(diagnostics_, len, offset, path_, what);
}

void BlockDecoder::fail(ChunkingError error) {
  done_ = true;
  pending_.clear();
  failure_ = error;
  throw error;
}

std::string decode_text(std::string text, DecodePolicy policy,
                        std::ostream* diagnostics) {
  const std::string origin = "<memory>";
  auto scan = utf8::scan(text);
  if (scan.valid_up_to == text.size()) return text;

  std::string out;
  out.reserve(text.size());
  const std::string_view bytes(text);
  std::size_t pos = 0;
  while (true) {
    out.append(bytes.substr(pos, scan.valid_up_to));
    pos += scan.valid_up_to;
    if (pos == bytes.size()) break;

    const bool truncated = scan.error_len == 0;
    const std::size_t len = truncated ? bytes.size() - pos : scan.error_len;
    const char* what = truncated ? "truncated" : "invalid";
    if (policy == DecodePolicy::Strict) {
      throw ChunkingError::decode(malformed_message(pos, origin, what));
    }
    warn_skipped(diagnostics, len, pos, origin, what);
    pos += len;
    if (pos == bytes.size()) break;
    scan = utf8::scan(bytes.substr(pos));
  }
  return out;
}

}  // namespace chunkwise
