#include <gtest/gtest.h>

#include "chunking/bytes_chunker.hpp"
#include "chunking/characters_chunker.hpp"
#include "chunking/chunker_builder.hpp"
#include "test_util.hpp"
#include "text/utf8.hpp"

#include <string>
#include <utility>
#include <vector>

using chunkwise::ChunkerBuilder;
using chunkwise::ChunkerOptions;
using chunkwise::DecodePolicy;
using chunkwise::test::TempFile;

namespace {

const std::vector<std::size_t> kBlockSizes = {1, 2, 3, 5, 7, 64, 333, 4096, 8192};

struct Window {
  std::size_t chunk_size;
  std::size_t overlap;
};

/// Byte windows keep chunk_size - overlap >= 7: a window may shrink by up to
/// three bytes and the next start may back off by three more.
const std::vector<Window> kByteWindows = {{16, 4}, {100, 10}, {64, 0}, {257, 200}, {9, 2}};
const std::vector<Window> kCharWindows = {{16, 4}, {100, 10}, {64, 0}, {2, 1}, {257, 256}};

}  // namespace

// ---------------------------------------------------------------------------
// File output == string output, for every read block size
// ---------------------------------------------------------------------------

TEST(StreamingEquivalence, BytesStrategy) {
  const std::string text = chunkwise::test::mixed_text(6000);
  TempFile f(text);

  for (const auto& w : kByteWindows) {
    auto expected = chunkwise::chunk_string_by_bytes(text, w.chunk_size, w.overlap)->all();
    ASSERT_FALSE(expected.empty());
    for (std::size_t block_size : kBlockSizes) {
      SCOPED_TRACE("chunk_size=" + std::to_string(w.chunk_size) +
                   " overlap=" + std::to_string(w.overlap) +
                   " block_size=" + std::to_string(block_size));
      ChunkerOptions opts;
      opts.block_size = block_size;
      auto actual = chunkwise::chunk_file_by_bytes(f.path(), w.chunk_size, w.overlap, opts)->all();
      EXPECT_EQ(actual, expected);
    }
  }
}

TEST(StreamingEquivalence, CharactersStrategy) {
  const std::string text = chunkwise::test::mixed_text(6000, 777);
  TempFile f(text);

  for (const auto& w : kCharWindows) {
    auto expected =
        chunkwise::chunk_string_by_characters(text, w.chunk_size, w.overlap)->all();
    ASSERT_FALSE(expected.empty());
    for (std::size_t block_size : kBlockSizes) {
      SCOPED_TRACE("chunk_size=" + std::to_string(w.chunk_size) +
                   " overlap=" + std::to_string(w.overlap) +
                   " block_size=" + std::to_string(block_size));
      ChunkerOptions opts;
      opts.block_size = block_size;
      auto actual =
          chunkwise::chunk_file_by_characters(f.path(), w.chunk_size, w.overlap, opts)->all();
      EXPECT_EQ(actual, expected);
    }
  }
}

TEST(StreamingEquivalence, ChunkLargerThanFile) {
  const std::string text = "tiny é file";
  TempFile f(text);
  for (const auto& builder :
       {ChunkerBuilder::by_bytes(4096, 100), ChunkerBuilder::by_characters(4096, 100)}) {
    auto chunks = builder.from_file(f.path())->all();
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], text);
  }
}

TEST(StreamingEquivalence, SkipPolicyDropsTheSameBytes) {
  std::string text = chunkwise::test::mixed_text(2000, 99);
  // Sprinkle malformed bytes: a stray continuation, an invalid lead, and a
  // truncated 3-byte sequence followed by ASCII.
  text.insert(100, "\x80");
  text.insert(900, "\xFF\xFE");
  text.insert(1500, "\xE2\x82" "Q");
  TempFile f(text);

  ChunkerOptions string_opts;
  string_opts.decode_policy = DecodePolicy::Skip;
  string_opts.diagnostics = nullptr;

  for (bool by_chars : {false, true}) {
    auto builder = by_chars ? ChunkerBuilder::by_characters(50, 10, string_opts)
                            : ChunkerBuilder::by_bytes(50, 10, string_opts);
    auto expected = builder.from_text(text)->all();
    for (const auto& c : expected) {
      EXPECT_TRUE(chunkwise::utf8::is_valid(c));
    }

    for (std::size_t block_size : {1u, 3u, 17u, 8192u}) {
      SCOPED_TRACE(std::string(builder.strategy_name()) +
                   " block_size=" + std::to_string(block_size));
      ChunkerOptions opts = string_opts;
      opts.block_size = block_size;
      auto file_builder = by_chars ? ChunkerBuilder::by_characters(50, 10, opts)
                                   : ChunkerBuilder::by_bytes(50, 10, opts);
      EXPECT_EQ(file_builder.from_file(f.path())->all(), expected);
    }
  }
}

// ---------------------------------------------------------------------------
// Reconstruction and cross-strategy properties
// ---------------------------------------------------------------------------

TEST(StreamingEquivalence, AsciiBytesMatchCharactersFromFile) {
  std::string text;
  for (int i = 0; i < 400; ++i) {
    text += "line " + std::to_string(i) + ": the quick brown fox\n";
  }
  TempFile f(text);

  ChunkerOptions opts;
  opts.block_size = 100;
  auto by_bytes = ChunkerBuilder::by_bytes(73, 11, opts).from_file(f.path())->all();
  auto by_chars = ChunkerBuilder::by_characters(73, 11, opts).from_file(f.path())->all();
  EXPECT_EQ(by_bytes, by_chars);

  // Trim the overlap off every chunk but the last and glue them back together.
  std::string rebuilt;
  for (std::size_t i = 0; i < by_bytes.size(); ++i) {
    const auto& c = by_bytes[i];
    rebuilt += (i + 1 == by_bytes.size()) ? c : c.substr(0, c.size() - 11);
  }
  EXPECT_EQ(rebuilt, text);
}

TEST(StreamingEquivalence, EveryChunkIsValidUtf8) {
  const std::string text = chunkwise::test::mixed_text(3000, 4242);
  TempFile f(text);

  ChunkerOptions opts;
  opts.block_size = 13;
  for (const auto& builder : {ChunkerBuilder::by_bytes(23, 7, opts),
                              ChunkerBuilder::by_characters(23, 7, opts)}) {
    auto chunker = builder.from_file(f.path());
    std::size_t total = 0;
    while (auto chunk = chunker->next()) {
      EXPECT_TRUE(chunkwise::utf8::is_valid(*chunk));
      EXPECT_FALSE(chunk->empty());
      ++total;
    }
    EXPECT_EQ(total, chunker->chunks_emitted());
    EXPECT_GT(total, 0u);
  }
}
