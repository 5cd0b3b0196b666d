#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>

#include <nlohmann/json.hpp>

#include "chunking/chunker_builder.hpp"

namespace chunkwise {

/// Outcome of draining one chunker to completion.
struct BenchmarkResult {
  double elapsed_secs{0.0};
  std::size_t num_chunks{0};
  std::size_t total_bytes{0};   ///< Sum of chunk lengths, overlap counted twice.
  double throughput_mb_s{0.0};  ///< total_bytes in MiB per second.
};

/// Called for every chunk with its 0-based index.
using ChunkObserver = std::function<void(std::size_t index, const std::string& chunk)>;

/// Build a chunker for `source` and pull every chunk, timing the whole run
/// (construction included).
/// @throws ChunkingError from construction or iteration.
BenchmarkResult run_benchmark(const ChunkerBuilder& builder, Source source,
                              const ChunkObserver& observer = {});

/// Map a CLI source type to a Source.  "string" chunks `value` itself,
/// "file" treats it as a path.
/// @throws std::invalid_argument for other types, including the network and
///         glob sources this tool does not resolve.
Source make_source(const std::string& source_type, const std::string& value);

/// {"elapsed_secs": .., "num_chunks": .., "total_bytes": .., "throughput_mb_s": ..}
void to_json(nlohmann::json& j, const BenchmarkResult& result);

/// The result as one JSON object on a single line.
void print_result(std::ostream& os, const BenchmarkResult& result);

/// {"error": message}, plus "kind" when given, on a single line.
void print_error(std::ostream& os, const std::string& message, const char* kind = nullptr);

}  // namespace chunkwise
