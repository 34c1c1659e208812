#include "juggl/occurrence_scanner.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

namespace juggl {

namespace {

struct WorkRange {
  std::size_t begin;
  std::size_t end; // extended end, clamped to the buffer
};

// Leftmost non-overlapping matching over the match starts in [from, end-|delim|].
// Record starts (match + |delim|) go to `out` when given. Returns the first
// position a following match may start at.
std::size_t scan_range(std::string_view buf, Delimiter delim, WorkRange r, std::size_t from,
                       std::vector<std::uint64_t>* out) {
  const std::size_t dlen = delim.size();
  std::size_t i = std::max(from, r.begin);
  if (r.end < dlen) return i;
  const std::size_t last = r.end - dlen;
  const char first = delim.front();
  while (i <= last) {
    if (buf[i] == first && buf.compare(i, dlen, delim) == 0) {
      if (out) out->push_back(static_cast<std::uint64_t>(i + dlen));
      i += dlen;
    } else {
      ++i;
    }
  }
  return i;
}

OffsetSet finish(std::vector<std::uint64_t> hits) {
  std::sort(hits.begin(), hits.end());
  hits.erase(std::unique(hits.begin(), hits.end()), hits.end());

  OffsetSet out;
  out.reserve(hits.size() + 1);
  out.push_back(0);
  for (auto h : hits) if (h != 0) out.push_back(h);
  return out;
}

}

unsigned resolve_threads(unsigned requested) noexcept {
  if (requested) return requested;
  unsigned hc = std::thread::hardware_concurrency();
  return hc ? hc : 1;
}

std::size_t default_range_bytes(std::size_t buffer_len, unsigned threads,
                                std::size_t floor_bytes) {
  const unsigned n = resolve_threads(threads);
  return std::max<std::size_t>(std::max<std::size_t>(floor_bytes, 1), buffer_len / n);
}

unsigned run_ranges(std::size_t count, unsigned threads,
                    const std::function<void(std::size_t)>& task) {
  if (count == 0) return 0;
  const unsigned workers = static_cast<unsigned>(
      std::min<std::size_t>(resolve_threads(threads), count));

  // Fan-out: every worker owns its error slot.
  std::vector<std::exception_ptr> errors(workers);
  std::atomic<std::size_t> next{0};
  std::atomic<bool> failed{false};

  auto work = [&](unsigned w) {
    try {
      for (;;) {
        if (failed.load(std::memory_order_relaxed)) return;
        const std::size_t k = next.fetch_add(1, std::memory_order_relaxed);
        if (k >= count) return;
        task(k);
      }
    } catch (...) {
      errors[w] = std::current_exception();
      failed.store(true, std::memory_order_relaxed);
    }
  };

  if (workers <= 1) {
    work(0);
  } else {
    std::vector<std::thread> pool;
    pool.reserve(workers - 1);
    try {
      for (unsigned w = 1; w < workers; ++w) pool.emplace_back(work, w);
    } catch (...) {
      failed.store(true);
      for (auto& t : pool) t.join();
      throw;
    }
    work(0);
    for (auto& t : pool) t.join();
  }

  // Fan-in: the caller sees results only if every range completed.
  for (auto& e : errors) if (e) std::rethrow_exception(e);
  return workers;
}

OffsetSet find_record_starts_sequential(std::string_view buf, Delimiter delim) {
  if (delim.empty() || buf.size() < delim.size()) return {0};
  std::vector<std::uint64_t> hits;
  (void)scan_range(buf, delim, WorkRange{0, buf.size()}, 0, &hits);
  return finish(std::move(hits));
}

OffsetSet find_record_starts(std::string_view buf, Delimiter delim,
                             const ScanConfig& cfg, ScanStats* stats) {
  if (delim.empty() || buf.size() < delim.size()) {
    if (stats) *stats = ScanStats{};
    return {0};
  }

  const std::size_t dlen = delim.size();
  const std::size_t range = std::max<std::size_t>(cfg.range_bytes, 1);

  std::vector<WorkRange> ranges;
  ranges.reserve(buf.size() / range + 1);
  for (std::size_t b = 0; b < buf.size(); b += range) {
    const std::size_t nominal_end = b + std::min(range, buf.size() - b);
    // extend by |delim|-1 so a match straddling the boundary is seen whole
    const std::size_t ext = std::min(buf.size(), nominal_end + (dlen - 1));
    ranges.push_back(WorkRange{b, ext});
  }

  // Where matching starts in each range. Without a self-overlap two matches
  // never share a byte, so every range starts at its own beginning.
  std::vector<std::size_t> entry(ranges.size());
  for (std::size_t k = 0; k < ranges.size(); ++k) entry[k] = ranges[k].begin;

  if (self_overlaps(delim)) {
    // A match near the end of range k can cover up to |delim|-1 bytes of
    // range k+1, and which matches range k+1 picks depends on that. First
    // record, for each of the |delim| possible entry points, where matching
    // leaves off; then chain the entry points left to right.
    std::vector<std::size_t> exits(ranges.size() * dlen);
    run_ranges(ranges.size(), cfg.threads, [&](std::size_t k) {
      for (std::size_t e = 0; e < dlen; ++e)
        exits[k * dlen + e] = scan_range(buf, delim, ranges[k], ranges[k].begin + e, nullptr);
    });
    for (std::size_t k = 0; k + 1 < ranges.size(); ++k) {
      const std::size_t covered = exits[k * dlen + (entry[k] - ranges[k].begin)];
      entry[k + 1] = std::max(ranges[k + 1].begin, covered);
    }
  }

  std::vector<std::vector<std::uint64_t>> partial(ranges.size());
  const unsigned workers = run_ranges(ranges.size(), cfg.threads, [&](std::size_t k) {
    (void)scan_range(buf, delim, ranges[k], entry[k], &partial[k]);
  });

  std::size_t total = 0;
  for (auto& p : partial) total += p.size();
  std::vector<std::uint64_t> hits;
  hits.reserve(total);
  for (auto& p : partial) {
    hits.insert(hits.end(), p.begin(), p.end());
    std::vector<std::uint64_t>().swap(p);
  }

  OffsetSet out = finish(std::move(hits));
  if (stats) {
    stats->ranges = ranges.size();
    stats->workers = workers;
    stats->matches = out.size() - 1;
  }
  return out;
}

}
