#include "chunking/chunker_builder.hpp"

#include <utility>

#include "chunking/bytes_chunker.hpp"
#include "chunking/characters_chunker.hpp"
#include "chunking/chunking_error.hpp"

namespace chunkwise {

ChunkerBuilder::ChunkerBuilder(Strategy strategy, ChunkerOptions options)
    : strategy_(std::move(strategy)), options_(options) {
  validate_window(chunk_size(), overlap());
  validate_block_size(options_.block_size);
}

ChunkerBuilder ChunkerBuilder::by_bytes(std::size_t chunk_size, std::size_t overlap,
                                        ChunkerOptions options) {
  return ChunkerBuilder(ByBytes{chunk_size, overlap}, options);
}

ChunkerBuilder ChunkerBuilder::by_characters(std::size_t chunk_size, std::size_t overlap,
                                             ChunkerOptions options) {
  return ChunkerBuilder(ByCharacters{chunk_size, overlap}, options);
}

std::unique_ptr<Chunker> ChunkerBuilder::from_text(std::string text) const {
  if (std::holds_alternative<ByBytes>(strategy_)) {
    return chunk_string_by_bytes(std::move(text), chunk_size(), overlap(), options_);
  }
  return chunk_string_by_characters(std::move(text), chunk_size(), overlap(), options_);
}

std::unique_ptr<Chunker> ChunkerBuilder::from_file(const std::string& path) const {
  if (std::holds_alternative<ByBytes>(strategy_)) {
    return chunk_file_by_bytes(path, chunk_size(), overlap(), options_);
  }
  return chunk_file_by_characters(path, chunk_size(), overlap(), options_);
}

std::unique_ptr<Chunker> ChunkerBuilder::on_source(Source source) const {
  if (auto* text = std::get_if<TextSource>(&source)) {
    return from_text(std::move(text->text));
  }
  return from_file(std::get<FileSource>(source).path);
}

std::size_t ChunkerBuilder::chunk_size() const {
  return std::visit([](const auto& s) { return s.chunk_size; }, strategy_);
}

std::size_t ChunkerBuilder::overlap() const {
  return std::visit([](const auto& s) { return s.overlap; }, strategy_);
}

const char* ChunkerBuilder::strategy_name() const {
  return std::holds_alternative<ByBytes>(strategy_) ? "bytes" : "chars";
}

}  // namespace chunkwise
