#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "juggl/permutation.hpp"

namespace juggl {

struct Config {
  std::string input;                    // path of the file to shuffle
  std::string delimiter;                // decoded bytes
  bool        delimiter_set = false;    // empty delimiter is legal, so track presence
  std::optional<std::uint64_t> seed;    // unset -> drawn once per run
  unsigned    threads = 0;              // 0 -> hardware concurrency
  std::size_t range_bytes = 0;          // 0 -> default_range_bytes()
  PermutationStrategy strategy = PermutationStrategy::Lazy;
  std::uint64_t materialize_below = 1u << 16; // Auto threshold
  std::string output;                   // empty or "-" -> stdout
  std::string report;                   // run.json path, empty -> none
  bool        verbose = false;
};

// "4096", "1.5MiB", "64k", "2G" (binary units, case-insensitive).
std::optional<std::size_t> parse_size(std::string_view s);

// Decimal or 0x-prefixed hex, full 64-bit range, no sign.
std::optional<std::uint64_t> parse_seed(std::string_view s);

std::optional<unsigned> parse_count(std::string_view s);

// Merge keys of a JSON object file into `cfg`. Unknown keys and ill-typed
// values are errors. The delimiter value is escape-decoded.
bool load_config_json(const std::string& path, Config* cfg, std::string* err_out = nullptr);

}
