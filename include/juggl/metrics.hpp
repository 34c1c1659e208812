#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace juggl {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct RunStats {
  std::uint64_t records = 0;
  std::uint64_t empty_records = 0;
  std::uint64_t bytes = 0;          // input
  std::uint64_t output_bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;

  std::vector<StageTiming> stages;  // in first-start order
};

class MetricsRegistry {
public:
  void reset();
  void add_records(std::uint64_t n) noexcept { records_ += n; }
  void add_empty_records(std::uint64_t n) noexcept { empty_ += n; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void add_output_bytes(std::uint64_t b) noexcept { out_bytes_ += b; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);
  double stage_ms(std::string_view name) const;

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t records_{0};
  std::uint64_t empty_{0};
  std::uint64_t bytes_{0};
  std::uint64_t out_bytes_{0};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, double> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

// Times one stage for the enclosing scope.
class StageTimer {
public:
  StageTimer(MetricsRegistry& m, std::string_view name) : m_(m), name_(name) { m_.start_stage(name_); }
  ~StageTimer() { m_.end_stage(name_); }
  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;

private:
  MetricsRegistry& m_;
  std::string name_;
};

}
