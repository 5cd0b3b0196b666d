#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "chunking/chunker_builder.hpp"
#include "chunking/chunking_error.hpp"
#include "config/chunking_config.hpp"
#include "runtime/benchmark.hpp"
#include "text/utf8.hpp"

namespace {

void usage(const char* prog) {
  std::cerr
      << "Usage:\n"
      << "  " << prog << " --input PATH|TEXT [options]\n"
      << "  " << prog << " <strategy> <source_type> <path|text> <chunk_size> <overlap> [options]\n\n"
      << "Required:\n"
      << "  --input  VALUE      File path (or the text itself with --source string)\n\n"
      << "Options:\n"
      << "  --config FILE       YAML config with chunking/reader sections (see configs/)\n"
      << "  --source TYPE       file | string (default: file)\n"
      << "  --strategy NAME     bytes | chars (default: bytes, or from --config)\n"
      << "  --chunk-size N      Chunk size in bytes or characters\n"
      << "  --overlap N         Overlap between consecutive chunks\n"
      << "  --block-size N      Bytes per file read (default: 8192)\n"
      << "  --on-invalid MODE   strict | skip handling of malformed UTF-8\n"
      << "  --log               Print the settings and a summary of every chunk to stderr\n"
      << "  -h, --help          Show this help message\n\n"
      << "On success one JSON object with elapsed_secs, num_chunks, total_bytes and\n"
      << "throughput_mb_s is written to stdout.  Failures write {\"error\": ...} to stderr.\n\n"
      << "Examples:\n"
      << "  " << prog << " --input data/book.txt --strategy chars --chunk-size 1024 --overlap 128\n"
      << "  " << prog << " --input data/book.txt --config configs/default_chars.yaml\n"
      << "  " << prog << " --source string --input \"some text\" --chunk-size 4 --overlap 1\n";
}

/// Printable preview of a chunk for --log.
std::string preview(const std::string& chunk) {
  const std::size_t max_len = 32;
  std::size_t cut = chunk.size();
  if (cut > max_len) {
    cut = chunkwise::utf8::boundary_at_or_before(chunk, max_len, 0).value_or(0);
  }
  std::string out;
  for (char c : chunk.substr(0, cut)) {
    if (c == '\n' || c == '\r' || c == '\t') out += ' ';
    else out += c;
  }
  if (cut < chunk.size()) out += "...";
  return out;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string input;
  std::string config_file;
  std::string source_type = "file";
  std::optional<std::string> strategy;
  std::optional<std::string> chunk_size;
  std::optional<std::string> overlap;
  std::optional<std::string> block_size;
  std::optional<std::string> on_invalid;
  bool log = false;
  std::vector<std::string> positional;

  // --- Parse arguments ---
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    }
    if (arg == "--log") { log = true; continue; }

    auto takes_value = [&](const char* what) {
      if (i + 1 >= argc) {
        chunkwise::print_error(std::cerr, arg + " requires " + what);
        return false;
      }
      return true;
    };

    if (arg == "--input") {
      if (!takes_value("a file path or text")) return 2;
      input = argv[++i];
      continue;
    }
    if (arg == "--config") {
      if (!takes_value("a file path")) return 2;
      config_file = argv[++i];
      continue;
    }
    if (arg == "--source") {
      if (!takes_value("file or string")) return 2;
      source_type = argv[++i];
      continue;
    }
    if (arg == "--strategy") {
      if (!takes_value("bytes or chars")) return 2;
      strategy = argv[++i];
      continue;
    }
    if (arg == "--chunk-size") {
      if (!takes_value("a number")) return 2;
      chunk_size = argv[++i];
      continue;
    }
    if (arg == "--overlap") {
      if (!takes_value("a number")) return 2;
      overlap = argv[++i];
      continue;
    }
    if (arg == "--block-size") {
      if (!takes_value("a number")) return 2;
      block_size = argv[++i];
      continue;
    }
    if (arg == "--on-invalid") {
      if (!takes_value("strict or skip")) return 2;
      on_invalid = argv[++i];
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      chunkwise::print_error(std::cerr, "unknown argument: " + arg);
      usage(argv[0]);
      return 2;
    }
    positional.push_back(arg);
  }

  // <strategy> <source_type> <path|text> <chunk_size> <overlap>
  if (!positional.empty()) {
    if (positional.size() != 5 || !input.empty()) {
      chunkwise::print_error(std::cerr,
                             "expected <strategy> <source_type> <path|text> <chunk_size> "
                             "<overlap>, or --input with flags");
      return 2;
    }
    strategy = positional[0];
    source_type = positional[1];
    input = positional[2];
    chunk_size = positional[3];
    overlap = positional[4];
  }

  if (input.empty()) {
    chunkwise::print_error(std::cerr, "--input is required");
    usage(argv[0]);
    return 2;
  }

  // --- Resolve configuration: file first, flags override ---
  chunkwise::ChunkingConfig cfg;
  try {
    if (!config_file.empty()) {
      cfg = chunkwise::load_chunking_config(config_file);
    }
    if (strategy) cfg.strategy = chunkwise::normalize_strategy(*strategy);
    if (chunk_size) cfg.chunk_size = chunkwise::parse_size("--chunk-size", *chunk_size);
    if (overlap) cfg.overlap = chunkwise::parse_size("--overlap", *overlap);
    if (block_size) cfg.options.block_size = chunkwise::parse_size("--block-size", *block_size);
    if (on_invalid) cfg.options.decode_policy = chunkwise::parse_decode_policy(*on_invalid);
  } catch (const std::exception& e) {
    chunkwise::print_error(std::cerr, e.what());
    return 1;
  }

  // stdout carries only the JSON result.
  if (log) {
    std::cerr << "Strategy: " << cfg.strategy << " (chunk_size=" << cfg.chunk_size
              << " overlap=" << cfg.overlap << ")\n";
    std::cerr << "Source:   " << source_type << "\n";
    std::cerr << "Reader:   block_size=" << cfg.options.block_size
              << " on_invalid_utf8=" << chunkwise::to_string(cfg.options.decode_policy)
              << "\n\n";
  }

  // --- Run ---
  try {
    auto builder = cfg.make_builder();
    auto source = chunkwise::make_source(source_type, input);

    chunkwise::ChunkObserver observer;
    if (log) {
      observer = [](std::size_t index, const std::string& chunk) {
        std::cerr << "[chunk] #" << index << "  bytes=" << chunk.size() << "  | "
                  << preview(chunk) << "\n";
      };
    }

    auto result = chunkwise::run_benchmark(builder, std::move(source), observer);
    chunkwise::print_result(std::cout, result);
  } catch (const chunkwise::ChunkingError& e) {
    chunkwise::print_error(std::cerr, std::string("Benchmark failed: ") + e.what(),
                           chunkwise::to_string(e.kind()));
    return 1;
  } catch (const std::exception& e) {
    chunkwise::print_error(std::cerr, std::string("Benchmark failed: ") + e.what());
    return 1;
  }

  return 0;
}
