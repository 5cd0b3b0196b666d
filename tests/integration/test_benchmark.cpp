#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "chunking/chunker_builder.hpp"
#include "chunking/chunking_error.hpp"
#include "runtime/benchmark.hpp"
#include "test_util.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using chunkwise::ChunkerBuilder;

namespace {
const std::string kHelloPath = CHUNKWISE_TEST_DATA_DIR "/hello_world.txt";
}

TEST(Benchmark, CountsChunksAndBytesOfFile) {
  auto builder = ChunkerBuilder::by_bytes(16, 0);
  auto result = chunkwise::run_benchmark(builder, chunkwise::FileSource{kHelloPath});

  EXPECT_EQ(result.num_chunks, 8u);
  EXPECT_EQ(result.total_bytes, 123u);
  EXPECT_GE(result.elapsed_secs, 0.0);
  EXPECT_GE(result.throughput_mb_s, 0.0);
}

TEST(Benchmark, OverlapIsCountedTwice) {
  auto builder = ChunkerBuilder::by_characters(10, 3);
  auto result =
      chunkwise::run_benchmark(builder, chunkwise::TextSource{"01234567890123456789"});
  EXPECT_EQ(result.num_chunks, 3u);
  EXPECT_EQ(result.total_bytes, 26u);
}

TEST(Benchmark, ObserverSeesEveryChunkInOrder) {
  const std::string text = chunkwise::test::read_file(kHelloPath);
  auto builder = ChunkerBuilder::by_bytes(20, 5);

  std::vector<std::size_t> indices;
  std::vector<std::string> seen;
  auto result = chunkwise::run_benchmark(
      builder, chunkwise::TextSource{text},
      [&](std::size_t index, const std::string& chunk) {
        indices.push_back(index);
        seen.push_back(chunk);
      });

  ASSERT_EQ(seen.size(), result.num_chunks);
  for (std::size_t i = 0; i < indices.size(); ++i) EXPECT_EQ(indices[i], i);
  EXPECT_EQ(seen, builder.from_text(text)->all());
}

TEST(Benchmark, MissingFileThrowsIo) {
  auto builder = ChunkerBuilder::by_bytes(16, 0);
  try {
    chunkwise::run_benchmark(builder, chunkwise::FileSource{"/nonexistent/bench.txt"});
    FAIL() << "expected ChunkingError";
  } catch (const chunkwise::ChunkingError& e) {
    EXPECT_EQ(e.kind(), chunkwise::ErrorKind::Io);
  }
}

TEST(Benchmark, MakeSource) {
  auto file = chunkwise::make_source("file", kHelloPath);
  ASSERT_TRUE(std::holds_alternative<chunkwise::FileSource>(file));
  EXPECT_EQ(std::get<chunkwise::FileSource>(file).path, kHelloPath);

  auto text = chunkwise::make_source("string", "hello");
  ASSERT_TRUE(std::holds_alternative<chunkwise::TextSource>(text));
  EXPECT_EQ(std::get<chunkwise::TextSource>(text).text, "hello");

  EXPECT_THROW(chunkwise::make_source("http", "http://example.com"), std::invalid_argument);
  EXPECT_THROW(chunkwise::make_source("glob", "*.txt"), std::invalid_argument);
  EXPECT_THROW(chunkwise::make_source("ftp", "x"), std::invalid_argument);
}

// ---------------------------------------------------------------------------
// JSON reports
// ---------------------------------------------------------------------------

TEST(Benchmark, PrintResultWritesOneJsonObject) {
  auto builder = ChunkerBuilder::by_bytes(16, 0);
  auto result = chunkwise::run_benchmark(builder, chunkwise::FileSource{kHelloPath});

  std::ostringstream os;
  chunkwise::print_result(os, result);
  const std::string out = os.str();
  ASSERT_FALSE(out.empty());
  EXPECT_EQ(out.back(), '\n');
  EXPECT_EQ(out.find('\n'), out.size() - 1);

  const auto j = nlohmann::json::parse(out);
  ASSERT_TRUE(j.is_object());
  EXPECT_EQ(j.size(), 4u);
  EXPECT_TRUE(j.at("elapsed_secs").is_number_float());
  EXPECT_TRUE(j.at("throughput_mb_s").is_number_float());
  EXPECT_EQ(j.at("num_chunks").get<std::size_t>(), 8u);
  EXPECT_EQ(j.at("total_bytes").get<std::size_t>(), 123u);
}

TEST(Benchmark, PrintErrorWritesErrorObject) {
  std::ostringstream plain;
  chunkwise::print_error(plain, "Benchmark failed: error reading file: /nope");
  auto j = nlohmann::json::parse(plain.str());
  EXPECT_EQ(j.at("error").get<std::string>(), "Benchmark failed: error reading file: /nope");
  EXPECT_FALSE(j.contains("kind"));

  std::ostringstream with_kind;
  chunkwise::print_error(with_kind, "bad \"quoted\" input", "decode");
  j = nlohmann::json::parse(with_kind.str());
  EXPECT_EQ(j.at("error").get<std::string>(), "bad \"quoted\" input");
  EXPECT_EQ(j.at("kind").get<std::string>(), "decode");
}

TEST(Benchmark, PrintErrorSurvivesInvalidUtf8InMessage) {
  std::ostringstream os;
  EXPECT_NO_THROW(chunkwise::print_error(os, "error reading file: /tmp/\xFF.txt", "io"));
  auto j = nlohmann::json::parse(os.str());
  EXPECT_EQ(j.at("kind").get<std::string>(), "io");
}
