#include "runtime/benchmark.hpp"

#include <chrono>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace chunkwise {

BenchmarkResult run_benchmark(const ChunkerBuilder& builder, Source source,
                              const ChunkObserver& observer) {
  BenchmarkResult result;
  const auto start = std::chrono::steady_clock::now();

  auto chunker = builder.on_source(std::move(source));
  while (auto chunk = chunker->next()) {
    if (observer) observer(result.num_chunks, *chunk);
    ++result.num_chunks;
    result.total_bytes += chunk->size();
  }

  const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
  result.elapsed_secs = elapsed.count();
  if (result.elapsed_secs > 0.0) {
    result.throughput_mb_s =
        static_cast<double>(result.total_bytes) / (1024.0 * 1024.0) / result.elapsed_secs;
  }
  return result;
}

Source make_source(const std::string& source_type, const std::string& value) {
  if (source_type == "file") return FileSource{value};
  if (source_type == "string" || source_type == "text") return TextSource{value};
  if (source_type == "http" || source_type == "https" || source_type == "glob") {
    throw std::invalid_argument("source type '" + source_type +
                                "' is not supported by this build (use file or string)");
  }
  throw std::invalid_argument("invalid source type '" + source_type +
                              "' (use file or string)");
}

void to_json(nlohmann::json& j, const BenchmarkResult& result) {
  j = nlohmann::json{{"elapsed_secs", result.elapsed_secs},
                     {"num_chunks", result.num_chunks},
                     {"total_bytes", result.total_bytes},
                     {"throughput_mb_s", result.throughput_mb_s}};
}

void print_result(std::ostream& os, const BenchmarkResult& result) {
  os << nlohmann::json(result).dump() << "\n";
}

void print_error(std::ostream& os, const std::string& message, const char* kind) {
  nlohmann::json j{{"error", message}};
  if (kind != nullptr) j["kind"] = kind;
  // Messages can carry file names in any encoding.
  os << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

}  // namespace chunkwise
