#include "juggl/shuffler.hpp"
#include "juggl/digest.hpp"
#include "juggl/errors.hpp"
#include "juggl/mapped_file.hpp"
#include "juggl/run_json.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <new>
#include <stdexcept>

namespace juggl {

ShuffleOutcome shuffle_buffer(std::string_view buf, Delimiter delim, std::uint64_t seed,
                              const ShuffleOptions& opts, const ChunkEmitter::ByteSink& sink,
                              MetricsRegistry* metrics) {
  MetricsRegistry local;
  MetricsRegistry& m = metrics ? *metrics : local;
  ShuffleOutcome res;

  OffsetSet offsets;
  {
    StageTimer t(m, "scan");
    offsets = find_record_starts(buf, delim, opts.scan, &res.scan);
  }

  ChunkIndex index;
  {
    StageTimer t(m, "index");
    index = build_chunk_index(buf.size(), offsets, delim.size());
    OffsetSet().swap(offsets);
  }
  res.chunks = index.size();
  m.add_bytes(buf.size());
  if (index.empty()) return res;

  StageTimer t(m, "emit");
  auto perm = make_permutation(opts.strategy, seed, index.size(), opts.materialize_below);
  res.strategy = perm->strategy();
  ChunkEmitter emitter(buf, index, delim);
  res.emit = emitter.emit(*perm, sink);
  m.add_records(res.emit.records);
  m.add_empty_records(res.emit.empty_skipped);
  m.add_output_bytes(res.emit.bytes);
  return res;
}

const char* to_string(RunStatus s) noexcept {
  switch (s) {
    case RunStatus::Ok:            return "ok";
    case RunStatus::InputError:    return "input error";
    case RunStatus::ParamError:    return "parameter error";
    case RunStatus::WriteError:    return "write error";
    case RunStatus::InternalError: return "internal error";
  }
  return "unknown";
}

Shuffler::Shuffler(Config cfg, SeedSource seeds)
    : cfg_(std::move(cfg)), seeds_(std::move(seeds)) {}

RunStatus Shuffler::fail(RunStatus s, std::string msg) {
  err_ = std::move(msg);
  std::cerr << "[juggl] " << to_string(s) << ": " << err_ << "\n";
  return s;
}

RunStatus Shuffler::run() {
  const auto t0 = Clock::now();
  MetricsRegistry metrics;
  MappedFile file;
  const RunStatus st = prepare(file, metrics);
  if (st != RunStatus::Ok) return st;

  if (cfg_.output.empty() || cfg_.output == "-") return shuffle_to(file, metrics, std::cout, t0);
  std::ofstream out(cfg_.output, std::ios::binary | std::ios::trunc);
  if (!out) return fail(RunStatus::WriteError, "cannot open output " + cfg_.output);
  return shuffle_to(file, metrics, out, t0);
}

RunStatus Shuffler::run(std::ostream& out) {
  const auto t0 = Clock::now();
  MetricsRegistry metrics;
  MappedFile file;
  const RunStatus st = prepare(file, metrics);
  if (st != RunStatus::Ok) return st;
  return shuffle_to(file, metrics, out, t0);
}

// Everything that can fail before a byte of output is due.
RunStatus Shuffler::prepare(MappedFile& file, MetricsRegistry& metrics) {
  err_.clear();
  summary_ = RunSummary{};

  if (cfg_.input.empty()) return fail(RunStatus::ParamError, "no input file");
  if (!cfg_.delimiter_set) return fail(RunStatus::ParamError, "no delimiter");

  {
    StageTimer t(metrics, "map");
    if (!file.open(cfg_.input)) return fail(RunStatus::InputError, file.error());
  }

  // fixed once, before any chunk is emitted
  summary_.seed_drawn = !cfg_.seed.has_value();
  if (cfg_.seed) {
    summary_.seed = *cfg_.seed;
  } else {
    try {
      if (!seeds_) throw std::runtime_error("no seed source");
      summary_.seed = seeds_();
    } catch (const std::exception& e) {
      return fail(RunStatus::InternalError, std::string("cannot draw a seed: ") + e.what());
    }
  }
  if (cfg_.verbose) {
    std::cerr << "[juggl] seed=" << summary_.seed
              << (summary_.seed_drawn ? " (random)" : "") << "\n";
  }
  return RunStatus::Ok;
}

RunStatus Shuffler::shuffle_to(const MappedFile& file, MetricsRegistry& metrics,
                               std::ostream& out, Clock::time_point t0) {
  namespace ch = std::chrono;
  const std::string_view buf = file.bytes();

  ShuffleOptions opts;
  opts.scan.threads = resolve_threads(cfg_.threads);
  opts.scan.range_bytes = cfg_.range_bytes ? cfg_.range_bytes
                                           : default_range_bytes(buf.size(), opts.scan.threads);
  opts.strategy = cfg_.strategy;
  opts.materialize_below = cfg_.materialize_below;

  std::unique_ptr<Sha256> digest;
  auto to_out = ostream_sink(out);
  auto sink = [&](std::string_view bytes) {
    to_out(bytes);
    if (digest) digest->update(bytes);
  };

  ShuffleOutcome res;
  try {
    if (!cfg_.report.empty()) digest = std::make_unique<Sha256>();
    res = shuffle_buffer(buf, cfg_.delimiter, summary_.seed, opts, sink, &metrics);
    out.flush();
    if (!out) throw WriteError("output stream rejected flush");
    if (digest) summary_.output_sha256 = digest->hex_final();
  } catch (const WriteError& e) {
    return fail(RunStatus::WriteError, e.what());
  } catch (const std::invalid_argument& e) {
    return fail(RunStatus::ParamError, e.what());
  } catch (const std::bad_alloc&) {
    return fail(RunStatus::InternalError, "out of memory");
  } catch (const std::exception& e) {
    return fail(RunStatus::InternalError, e.what());
  }

  const double wall_ms = ch::duration<double, std::milli>(Clock::now() - t0).count();
  summary_.chunks = res.chunks;
  summary_.records_written = res.emit.records;
  summary_.output_bytes = res.emit.bytes;
  summary_.stats = metrics.snapshot(wall_ms);

  if (cfg_.verbose) {
    std::cerr << "[scan] ranges=" << res.scan.ranges << " workers=" << res.scan.workers
              << " range_bytes=" << opts.scan.range_bytes << " matches=" << res.scan.matches << "\n";
    std::cerr << "[emit] chunks=" << res.chunks << " records=" << res.emit.records
              << " empty=" << res.emit.empty_skipped << " bytes=" << res.emit.bytes
              << " strategy=" << to_string(res.strategy) << "\n";
    for (const auto& s : summary_.stats.stages)
      std::cerr << "[juggl] stage " << s.name << " " << s.duration_ms << " ms\n";
  }

  if (!cfg_.report.empty()) {
    RunJsonPayload p{};
    p.records = summary_.stats.records;
    p.empty_records = summary_.stats.empty_records;
    p.bytes = summary_.stats.bytes;
    p.output_bytes = summary_.stats.output_bytes;
    p.wall_time_ms = wall_ms;
    p.throughput_mb_s = summary_.stats.throughput_mb_s;
    for (const auto& s : summary_.stats.stages) p.stage_times.emplace_back(s.name, s.duration_ms);
    p.seed = summary_.seed;
    p.seed_source = summary_.seed_drawn ? "random" : "explicit";
    p.strategy = to_string(res.strategy);
    p.threads = opts.scan.threads;
    p.ranges = res.scan.ranges;
    p.range_bytes = opts.scan.range_bytes;
    p.delimiter_len = cfg_.delimiter.size();
    p.filename = cfg_.input;
    p.file_size = file.size();
    p.output_sha256 = summary_.output_sha256;

    std::string err;
    if (!write_run_json(cfg_.report, RunJsonWriter::to_json(p), &err)) {
      return fail(RunStatus::WriteError, "report: " + err);
    }
  }
  return RunStatus::Ok;
}

}
