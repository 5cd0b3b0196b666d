#pragma once

#include <cstddef>

namespace chunkwise {

/// Half-open byte interval [start, end) into a text buffer.
struct ByteRange {
  std::size_t start{0};
  std::size_t end{0};

  std::size_t size() const { return end - start; }
  bool operator==(const ByteRange&) const = default;
};

}  // namespace chunkwise
