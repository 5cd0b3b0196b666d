#include "chunking/chunker.hpp"

#include <exception>
#include <utility>

namespace chunkwise {

std::optional<std::string> Chunker::next() {
  std::optional<std::string> chunk;
  if (peeked_) {
    chunk = std::move(peeked_);
    peeked_.reset();
  } else {
    chunk = pull();
  }
  if (chunk) ++emitted_;
  return chunk;
}

bool Chunker::has_next() {
  if (!peeked_) peeked_ = pull();
  return peeked_.has_value();
}

std::optional<std::string> Chunker::pull() {
  if (failure_) std::rethrow_exception(failure_);
  try {
    return produce();
  } catch (const ChunkingError&) {
    // A failed chunker stays failed.
    failure_ = std::current_exception();
    throw;
  }
}

std::vector<std::string> Chunker::all() {
  std::vector<std::string> out;
  while (auto chunk = next()) {
    out.push_back(std::move(*chunk));
  }
  return out;
}

}  // namespace chunkwise
