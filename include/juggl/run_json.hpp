#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace juggl {

struct RunJsonPayload {
  // Top-level KPIs
  std::uint64_t records = 0;
  std::uint64_t empty_records = 0;
  std::uint64_t bytes = 0;
  std::uint64_t output_bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;

  std::vector<std::pair<std::string, double>> stage_times;

  // Shuffle parameters
  std::uint64_t seed = 0;
  std::string seed_source;      // "explicit" | "random"
  std::string strategy;
  unsigned threads = 0;
  std::uint64_t ranges = 0;
  std::uint64_t range_bytes = 0;
  std::uint64_t delimiter_len = 0;

  // Input / output
  std::string filename;
  std::uint64_t file_size = 0;
  std::string output_sha256;
};

class RunJsonWriter {
public:
  static std::string to_json(const RunJsonPayload& p);
};

// Write `json` to `path`, creating parent directories.
bool write_run_json(const std::string& path, const std::string& json,
                    std::string* err_out = nullptr);

}
