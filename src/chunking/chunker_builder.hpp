#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <variant>

#include "chunking/chunker.hpp"

namespace chunkwise {

/// Chunk this exact string in memory.
struct TextSource {
  std::string text;
};

/// Stream the file at this path.
struct FileSource {
  std::string path;
};

using Source = std::variant<TextSource, FileSource>;

/// Chunk sizes and overlap counted in bytes.
struct ByBytes {
  std::size_t chunk_size{0};
  std::size_t overlap{0};
};

/// Chunk sizes and overlap counted in Unicode scalar values.
struct ByCharacters {
  std::size_t chunk_size{0};
  std::size_t overlap{0};
};

using Strategy = std::variant<ByBytes, ByCharacters>;

/// Chooses a sizing strategy once and turns sources into chunkers.
///
/// The window parameters are validated when the builder is created, so a
/// builder that exists can always produce chunkers.
///
///   auto chunks = ChunkerBuilder::by_characters(512, 64).from_file("book.txt");
///   while (auto chunk = chunks->next()) { ... }
class ChunkerBuilder {
public:
  /// @throws ChunkingError(InvalidArguments) if overlap >= chunk_size.
  /// @throws std::invalid_argument if options.block_size is 0 or above
  ///         BlockDecoder::kMaxBlockSize.
  explicit ChunkerBuilder(Strategy strategy, ChunkerOptions options = {});

  static ChunkerBuilder by_bytes(std::size_t chunk_size, std::size_t overlap,
                                 ChunkerOptions options = {});
  static ChunkerBuilder by_characters(std::size_t chunk_size, std::size_t overlap,
                                      ChunkerOptions options = {});

  std::unique_ptr<Chunker> from_text(std::string text) const;
  std::unique_ptr<Chunker> from_file(const std::string& path) const;
  std::unique_ptr<Chunker> on_source(Source source) const;

  const Strategy& strategy() const { return strategy_; }
  const ChunkerOptions& options() const { return options_; }
  std::size_t chunk_size() const;
  std::size_t overlap() const;

  /// "bytes" or "chars".
  const char* strategy_name() const;

private:
  Strategy strategy_;
  ChunkerOptions options_;
};

}  // namespace chunkwise
