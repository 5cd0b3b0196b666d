#pragma once

#include <cstddef>
#include <string>

#include "chunking/chunker.hpp"
#include "chunking/chunker_builder.hpp"
#include "text/block_decoder.hpp"

namespace chunkwise {

/// Chunking parameters as read from a YAML file.
///
///   chunking:
///     strategy: chars          # bytes | chars
///     chunk_size: 1024
///     overlap: 128
///   reader:
///     block_size: 8192
///     on_invalid_utf8: skip    # strict | skip
///
/// Every key is optional; missing keys keep the defaults below.
struct ChunkingConfig {
  std::string strategy = "bytes";
  std::size_t chunk_size = 1024;
  std::size_t overlap = 0;
  ChunkerOptions options;

  /// @throws ChunkingError(InvalidArguments) if overlap >= chunk_size.
  /// @throws std::invalid_argument on an unknown strategy or a block size
  ///         outside (0, BlockDecoder::kMaxBlockSize].
  void validate() const;

  /// Build a ChunkerBuilder for these parameters (validates first).
  ChunkerBuilder make_builder() const;
};

/// Load a config file.
/// @throws std::runtime_error if the file is missing, is not valid YAML, or
///         holds a value of the wrong type or an unknown name.
ChunkingConfig load_chunking_config(const std::string& path);

/// Parse config from YAML text (same rules as load_chunking_config).
ChunkingConfig parse_chunking_config(const std::string& yaml_text);

/// Parse a decimal size given on the command line.  Only plain digits are
/// accepted: no sign, no whitespace, no suffix.
/// @throws std::invalid_argument naming `name` otherwise, or on overflow.
std::size_t parse_size(const std::string& name, const std::string& value);

/// "strict" / "skip" to DecodePolicy.
/// @throws std::invalid_argument for any other name.
DecodePolicy parse_decode_policy(const std::string& name);
const char* to_string(DecodePolicy policy);

/// "bytes" / "chars" (also "characters").
/// @throws std::invalid_argument for any other name.
std::string normalize_strategy(const std::string& name);

}  // namespace chunkwise
