#include "juggl/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace juggl {

void MetricsRegistry::reset() {
  records_ = empty_ = bytes_ = out_bytes_ = 0;
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (std::find(stage_order_.begin(), stage_order_.end(), key) == stage_order_.end())
    stage_order_.push_back(key);
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration<double, std::milli>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += ms;
  stage_starts_.erase(it);
}

double MetricsRegistry::stage_ms(std::string_view name) const {
  auto it = stage_accum_ms_.find(std::string(name));
  return it == stage_accum_ms_.end() ? 0.0 : it->second;
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.records = records_;
  r.empty_records = empty_;
  r.bytes = bytes_;
  r.output_bytes = out_bytes_;
  r.wall_time_ms = wall_ms;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;

  r.stages.reserve(stage_order_.size());
  for (auto& name : stage_order_) r.stages.push_back(StageTiming{name, stage_ms(name)});
  return r;
}

}
