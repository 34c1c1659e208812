#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

#include "juggl/chunk_emitter.hpp"
#include "juggl/chunk_index.hpp"
#include "juggl/config.hpp"
#include "juggl/mapped_file.hpp"
#include "juggl/metrics.hpp"
#include "juggl/occurrence_scanner.hpp"
#include "juggl/permutation.hpp"

namespace juggl {

struct ShuffleOptions {
  ScanConfig scan;
  PermutationStrategy strategy = PermutationStrategy::Lazy;
  std::uint64_t materialize_below = 1u << 16;
};

struct ShuffleOutcome {
  std::uint64_t chunks = 0;
  PermutationStrategy strategy = PermutationStrategy::Lazy; // as resolved
  ScanStats scan;
  EmitStats emit;
};

// Scan, index, permute and emit one resident buffer. Throws on any failure;
// bytes already handed to `sink` stay written. An empty buffer emits nothing.
ShuffleOutcome shuffle_buffer(std::string_view buf, Delimiter delim, std::uint64_t seed,
                              const ShuffleOptions& opts, const ChunkEmitter::ByteSink& sink,
                              MetricsRegistry* metrics = nullptr);

enum class RunStatus {
  Ok            = 0,
  InputError    = 2, // input missing, unreadable or unmappable
  ParamError    = 3, // bad seed, sizes, missing delimiter, ...
  WriteError    = 4, // destination rejected a write
  InternalError = 5, // a scan worker or allocation failed
};

const char* to_string(RunStatus s) noexcept;

struct RunSummary {
  std::uint64_t seed = 0;
  bool seed_drawn = false;
  std::uint64_t chunks = 0;
  std::uint64_t records_written = 0;
  std::uint64_t output_bytes = 0;
  std::string output_sha256;  // filled only when a report is requested
  RunStats stats;
};

// One complete run over `Config`: map input, shuffle, write output and
// the optional run.json report. Parameters, input and seed are settled
// before the output destination is opened, so a run that fails early
// leaves an existing output file untouched.
class Shuffler {
public:
  using SeedSource = std::function<std::uint64_t()>;

  explicit Shuffler(Config cfg, SeedSource seeds = draw_seed);

  RunStatus run();                  // output to cfg.output, or stdout
  RunStatus run(std::ostream& out);

  const std::string& error() const noexcept { return err_; }
  const RunSummary& summary() const noexcept { return summary_; }

private:
  using Clock = std::chrono::steady_clock;

  RunStatus fail(RunStatus s, std::string msg);
  RunStatus prepare(MappedFile& file, MetricsRegistry& metrics);
  RunStatus shuffle_to(const MappedFile& file, MetricsRegistry& metrics,
                       std::ostream& out, Clock::time_point t0);

  Config cfg_;
  SeedSource seeds_;
  std::string err_;
  RunSummary summary_;
};

}
