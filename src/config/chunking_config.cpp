#include "config/chunking_config.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace chunkwise {

namespace {

ChunkingConfig from_yaml(const YAML::Node& root, const std::string& origin) {
  ChunkingConfig cfg;
  if (!root || root.IsNull()) return cfg;
  if (!root.IsMap()) {
    throw std::runtime_error("Config " + origin + ": top level must be a mapping");
  }

  try {
    if (const auto chunking = root["chunking"]) {
      if (chunking["strategy"]) {
        cfg.strategy = normalize_strategy(chunking["strategy"].as<std::string>());
      }
      if (chunking["chunk_size"]) cfg.chunk_size = chunking["chunk_size"].as<std::size_t>();
      if (chunking["overlap"]) cfg.overlap = chunking["overlap"].as<std::size_t>();
    }
    if (const auto reader = root["reader"]) {
      if (reader["block_size"]) {
        cfg.options.block_size = reader["block_size"].as<std::size_t>();
      }
      if (reader["on_invalid_utf8"]) {
        cfg.options.decode_policy =
            parse_decode_policy(reader["on_invalid_utf8"].as<std::string>());
      }
    }
    validate_block_size(cfg.options.block_size);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Config " + origin + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("Config " + origin + ": " + e.what());
  }
  return cfg;
}

}  // namespace

void ChunkingConfig::validate() const {
  normalize_strategy(strategy);
  validate_window(chunk_size, overlap);
  validate_block_size(options.block_size);
}

ChunkerBuilder ChunkingConfig::make_builder() const {
  validate();
  if (normalize_strategy(strategy) == "bytes") {
    return ChunkerBuilder::by_bytes(chunk_size, overlap, options);
  }
  return ChunkerBuilder::by_characters(chunk_size, overlap, options);
}

ChunkingConfig load_chunking_config(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Config " + path + ": " + e.what());
  }
  return from_yaml(root, path);
}

ChunkingConfig parse_chunking_config(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Config <memory>: ") + e.what());
  }
  return from_yaml(root, "<memory>");
}

std::size_t parse_size(const std::string& name, const std::string& value) {
  const bool digits_only =
      !value.empty() && std::all_of(value.begin(), value.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      });
  std::size_t consumed = 0;
  unsigned long long parsed = 0;
  if (digits_only) {
    try {
      parsed = std::stoull(value, &consumed);
    } catch (const std::out_of_range&) {
      throw std::invalid_argument(name + " is out of range: '" + value + "'");
    }
  }
  if (!digits_only || consumed != value.size() ||
      parsed > std::numeric_limits<std::size_t>::max()) {
    throw std::invalid_argument(name + " requires a non-negative integer, got '" + value + "'");
  }
  return static_cast<std::size_t>(parsed);
}

DecodePolicy parse_decode_policy(const std::string& name) {
  if (name == "strict") return DecodePolicy::Strict;
  if (name == "skip") return DecodePolicy::Skip;
  throw std::invalid_argument("unknown decode policy '" + name + "' (use strict or skip)");
}

const char* to_string(DecodePolicy policy) {
  return policy == DecodePolicy::Strict ? "strict" : "skip";
}

std::string normalize_strategy(const std::string& name) {
  if (name == "bytes") return "bytes";
  if (name == "chars" || name == "characters") return "chars";
  throw std::invalid_argument("unknown strategy '" + name + "' (use bytes or chars)");
}

}  // namespace chunkwise
