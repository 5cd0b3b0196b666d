#include <gtest/gtest.h>

#include "chunking/chunker_builder.hpp"
#include "chunking/chunking_error.hpp"
#include "test_util.hpp"

#include <stdexcept>
#include <string>
#include <variant>

using chunkwise::ByBytes;
using chunkwise::ByCharacters;
using chunkwise::ChunkerBuilder;
using chunkwise::ChunkingError;
using chunkwise::ErrorKind;
using chunkwise::FileSource;
using chunkwise::TextSource;

TEST(ChunkerBuilder, ValidatesEagerly) {
  try {
    ChunkerBuilder::by_bytes(8, 8);
    FAIL() << "expected ChunkingError";
  } catch (const ChunkingError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidArguments);
  }
  EXPECT_THROW(ChunkerBuilder::by_characters(2, 3), ChunkingError);
  EXPECT_THROW(ChunkerBuilder(ByBytes{0, 0}), ChunkingError);
}

TEST(ChunkerBuilder, RejectsZeroBlockSize) {
  chunkwise::ChunkerOptions opts;
  opts.block_size = 0;
  EXPECT_THROW(ChunkerBuilder::by_bytes(8, 2, opts), std::invalid_argument);
}

TEST(ChunkerBuilder, RejectsOversizedBlockSize) {
  chunkwise::ChunkerOptions opts;
  opts.block_size = chunkwise::BlockDecoder::kMaxBlockSize + 1;
  EXPECT_THROW(ChunkerBuilder::by_characters(8, 2, opts), std::invalid_argument);
}

TEST(ChunkerBuilder, ExposesStrategy) {
  auto bytes = ChunkerBuilder::by_bytes(64, 8);
  EXPECT_TRUE(std::holds_alternative<ByBytes>(bytes.strategy()));
  EXPECT_STREQ(bytes.strategy_name(), "bytes");
  EXPECT_EQ(bytes.chunk_size(), 64u);
  EXPECT_EQ(bytes.overlap(), 8u);

  ChunkerBuilder chars(ByCharacters{32, 4});
  EXPECT_TRUE(std::holds_alternative<ByCharacters>(chars.strategy()));
  EXPECT_STREQ(chars.strategy_name(), "chars");
  EXPECT_EQ(chars.chunk_size(), 32u);
  EXPECT_EQ(chars.overlap(), 4u);
}

TEST(ChunkerBuilder, TextAndFileSourcesAgree) {
  std::string path = CHUNKWISE_TEST_DATA_DIR "/unicode_sample.txt";
  const std::string text = chunkwise::test::read_file(path);

  for (const auto& builder : {ChunkerBuilder::by_bytes(24, 6), ChunkerBuilder::by_characters(12, 3)}) {
    SCOPED_TRACE(builder.strategy_name());
    auto from_text = builder.on_source(TextSource{text})->all();
    auto from_file = builder.on_source(FileSource{path})->all();
    ASSERT_FALSE(from_text.empty());
    EXPECT_EQ(from_text, from_file);
    EXPECT_EQ(builder.from_text(text)->all(), from_text);
    EXPECT_EQ(builder.from_file(path)->all(), from_file);
  }
}

TEST(ChunkerBuilder, StrategiesDifferOnMultiByteText) {
  const std::string text = "ééééé";  // 5 characters, 10 bytes
  auto by_bytes = ChunkerBuilder::by_bytes(4, 0).from_text(text)->all();
  auto by_chars = ChunkerBuilder::by_characters(4, 0).from_text(text)->all();
  ASSERT_EQ(by_bytes.size(), 3u);
  EXPECT_EQ(by_bytes[0], "éé");
  ASSERT_EQ(by_chars.size(), 2u);
  EXPECT_EQ(by_chars[0], "éééé");
  EXPECT_EQ(by_chars[1], "é");
}

TEST(ChunkerBuilder, BuilderIsReusable) {
  auto builder = ChunkerBuilder::by_characters(3, 1);
  auto a = builder.from_text("abcdef")->all();
  auto b = builder.from_text("abcdef")->all();
  EXPECT_EQ(a, b);
}
